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

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "storage/disk/disk_space_monitor.hpp"
#include "type/type.hpp"
#include "upload/uploader.hpp"

namespace gallup {
struct AppConfig {
  // Run configuration handed to the uploader
  uint32_t    thumbnail_size_             = 3;
  uint32_t    thumbnail_format_           = 2;
  uint32_t    max_retries_                = 3;
  bool        public_gallery_             = true;
  uint32_t    parallel_batch_size_        = 4;

  // Admission control
  uint32_t    global_concurrency_limit_   = 3;
  uint32_t    per_host_concurrency_limit_ = 2;
  uint64_t    disk_warning_mb_            = 2048;
  uint64_t    disk_critical_mb_           = 512;
  uint64_t    disk_emergency_mb_          = 100;

  // Workers
  uint32_t    worker_count_               = 1;
  uint32_t    slot_timeout_ms_            = 5000;
  uint32_t    idle_wait_ms_               = 100;
  uint32_t    maintenance_interval_ms_    = 60000;
  host_name_t default_host_               = "imx";

  std::string log_level_                  = "info";

  auto        ToUploadConfig() const -> UploadConfig;
  auto        ToThresholds() const -> DiskThresholds;

  auto        operator==(const AppConfig& other) const -> bool = default;
};

/**
 * @brief Reject configurations the pipeline cannot run with.
 *
 * @throw std::invalid_argument naming the offending key
 */
void ValidateConfig(const AppConfig& config);

auto ConfigToJson(const AppConfig& config) -> nlohmann::json;
/**
 * @brief Missing keys keep their defaults; keys of the wrong type are rejected.
 *
 * @throw std::invalid_argument
 */
auto ConfigFromJson(const nlohmann::json& json) -> AppConfig;

/**
 * @brief Holds the live configuration and tells subscribers when it changes.
 *
 * Readers take a snapshot; a change never alters a snapshot already taken.
 */
class ConfigService {
 public:
  using Subscriber     = std::function<void(const AppConfig& old_config, const AppConfig& new_config)>;
  using subscription_t = uint32_t;

  ConfigService() = default;
  explicit ConfigService(AppConfig initial);

  void Load(const std::filesystem::path& config_path);
  void Save(const std::filesystem::path& config_path) const;

  /**
   * @brief Validate and swap in a new configuration, then notify subscribers. An invalid
   * configuration leaves the current one in place.
   */
  void Update(const AppConfig& config);
  auto Snapshot() const -> AppConfig;

  auto Subscribe(Subscriber subscriber) -> subscription_t;
  void Unsubscribe(subscription_t id);

 private:
  mutable std::mutex                   lock_;
  AppConfig                            config_{};
  std::map<subscription_t, Subscriber> subscribers_;
  subscription_t                       next_id_ = 0;
};
};  // namespace gallup
