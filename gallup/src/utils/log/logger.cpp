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

#include "utils/log/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace gallup {
namespace {
std::mutex& RegistryLock() {
  static std::mutex lock;
  return lock;
}
};  // namespace

auto Logger::Get(const std::string& category) -> std::shared_ptr<spdlog::logger> {
  // spdlog::get and create are not atomic together
  std::lock_guard<std::mutex> lock(RegistryLock());
  auto                        logger = spdlog::get(category);
  if (logger) {
    return logger;
  }
  logger = spdlog::stdout_color_mt(category);
  logger->set_level(spdlog::get_level());
  return logger;
}

void Logger::SetLevel(const std::string& level_name) {
  std::lock_guard<std::mutex> lock(RegistryLock());
  spdlog::set_level(spdlog::level::from_str(level_name));
}
};  // namespace gallup
