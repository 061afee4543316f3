//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <string>

namespace gallup {
/**
 * @brief Category loggers shared by the whole pipeline ("uploads", "queue", "disk", ...).
 */
class Logger {
 public:
  static auto Get(const std::string& category) -> std::shared_ptr<spdlog::logger>;

  /**
   * @brief Set the level of every category logger, existing and future.
   *
   * @param level_name spdlog level name ("trace", "debug", "info", "warn", "error", "off")
   */
  static void SetLevel(const std::string& level_name);
};
};  // namespace gallup
