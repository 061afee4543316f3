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

#include "app/config_service.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

#include "utils/log/logger.hpp"

namespace gallup {
namespace {
const std::vector<std::string> kLogLevels = {"trace", "debug", "info",    "warn",
                                             "warning", "error", "critical", "off"};

template <typename T>
void ReadKey(const nlohmann::json& json, const char* key, T& target) {
  auto it = json.find(key);
  if (it == json.end()) {
    return;
  }
  try {
    target = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("Config key '") + key + "' has the wrong type: " +
                                e.what());
  }
}
};  // namespace

auto AppConfig::ToUploadConfig() const -> UploadConfig {
  UploadConfig config;
  config.thumbnail_size_      = thumbnail_size_;
  config.thumbnail_format_    = thumbnail_format_;
  config.max_retries_         = max_retries_;
  config.public_gallery_      = public_gallery_;
  config.parallel_batch_size_ = parallel_batch_size_;
  return config;
}

auto AppConfig::ToThresholds() const -> DiskThresholds {
  return DiskThresholds::FromMegabytes(disk_warning_mb_, disk_critical_mb_, disk_emergency_mb_);
}

void ValidateConfig(const AppConfig& config) {
  if (!(config.disk_emergency_mb_ < config.disk_critical_mb_ &&
        config.disk_critical_mb_ < config.disk_warning_mb_)) {
    throw std::invalid_argument(
        "disk thresholds must satisfy disk_emergency_mb < disk_critical_mb < disk_warning_mb");
  }
  if (config.global_concurrency_limit_ < 1) {
    throw std::invalid_argument("global_concurrency_limit must be at least 1");
  }
  if (config.per_host_concurrency_limit_ < 1) {
    throw std::invalid_argument("per_host_concurrency_limit must be at least 1");
  }
  if (config.worker_count_ < 1) {
    throw std::invalid_argument("worker_count must be at least 1");
  }
  if (config.parallel_batch_size_ < 1) {
    throw std::invalid_argument("parallel_batch_size must be at least 1");
  }
  if (config.default_host_.empty()) {
    throw std::invalid_argument("default_host must not be empty");
  }
  if (std::find(kLogLevels.begin(), kLogLevels.end(), config.log_level_) == kLogLevels.end()) {
    throw std::invalid_argument("Unknown log_level: " + config.log_level_);
  }
}

auto ConfigToJson(const AppConfig& config) -> nlohmann::json {
  nlohmann::json json;
  json["thumbnail_size"]             = config.thumbnail_size_;
  json["thumbnail_format"]           = config.thumbnail_format_;
  json["max_retries"]                = config.max_retries_;
  json["public_gallery"]             = config.public_gallery_;
  json["parallel_batch_size"]        = config.parallel_batch_size_;
  json["global_concurrency_limit"]   = config.global_concurrency_limit_;
  json["per_host_concurrency_limit"] = config.per_host_concurrency_limit_;
  json["disk_warning_mb"]            = config.disk_warning_mb_;
  json["disk_critical_mb"]           = config.disk_critical_mb_;
  json["disk_emergency_mb"]          = config.disk_emergency_mb_;
  json["worker_count"]               = config.worker_count_;
  json["slot_timeout_ms"]            = config.slot_timeout_ms_;
  json["idle_wait_ms"]               = config.idle_wait_ms_;
  json["maintenance_interval_ms"]    = config.maintenance_interval_ms_;
  json["default_host"]               = config.default_host_;
  json["log_level"]                  = config.log_level_;
  return json;
}

auto ConfigFromJson(const nlohmann::json& json) -> AppConfig {
  if (!json.is_object()) {
    throw std::invalid_argument("Config document must be a JSON object");
  }
  AppConfig config;
  ReadKey(json, "thumbnail_size", config.thumbnail_size_);
  ReadKey(json, "thumbnail_format", config.thumbnail_format_);
  ReadKey(json, "max_retries", config.max_retries_);
  ReadKey(json, "public_gallery", config.public_gallery_);
  ReadKey(json, "parallel_batch_size", config.parallel_batch_size_);
  ReadKey(json, "global_concurrency_limit", config.global_concurrency_limit_);
  ReadKey(json, "per_host_concurrency_limit", config.per_host_concurrency_limit_);
  ReadKey(json, "disk_warning_mb", config.disk_warning_mb_);
  ReadKey(json, "disk_critical_mb", config.disk_critical_mb_);
  ReadKey(json, "disk_emergency_mb", config.disk_emergency_mb_);
  ReadKey(json, "worker_count", config.worker_count_);
  ReadKey(json, "slot_timeout_ms", config.slot_timeout_ms_);
  ReadKey(json, "idle_wait_ms", config.idle_wait_ms_);
  ReadKey(json, "maintenance_interval_ms", config.maintenance_interval_ms_);
  ReadKey(json, "default_host", config.default_host_);
  ReadKey(json, "log_level", config.log_level_);
  return config;
}

ConfigService::ConfigService(AppConfig initial) {
  ValidateConfig(initial);
  config_ = std::move(initial);
}

void ConfigService::Load(const std::filesystem::path& config_path) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file for reading: " + config_path.string());
  }

  nlohmann::json json;
  try {
    file >> json;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument("Config file " + config_path.string() +
                                " is not valid JSON: " + e.what());
  }
  Update(ConfigFromJson(json));
  Logger::Get("config")->info("Loaded config from {}", config_path.string());
}

void ConfigService::Save(const std::filesystem::path& config_path) const {
  const auto json = ConfigToJson(Snapshot());

  std::ofstream file(config_path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file for writing: " + config_path.string());
  }
  file << json.dump(4);
  file.close();
}

void ConfigService::Update(const AppConfig& config) {
  ValidateConfig(config);

  AppConfig               previous;
  std::vector<Subscriber> snapshot;
  {
    std::lock_guard<std::mutex> lock(lock_);
    previous = config_;
    config_  = config;
    for (const auto& [id, subscriber] : subscribers_) {
      snapshot.push_back(subscriber);
    }
  }
  if (previous == config) {
    return;
  }
  Logger::Get("config")->info("Configuration updated");
  for (auto& subscriber : snapshot) {
    try {
      subscriber(previous, config);
    } catch (const std::exception& e) {
      Logger::Get("config")->error("Config subscriber failed: {}", e.what());
    }
  }
}

auto ConfigService::Snapshot() const -> AppConfig {
  std::lock_guard<std::mutex> lock(lock_);
  return config_;
}

auto ConfigService::Subscribe(Subscriber subscriber) -> subscription_t {
  std::lock_guard<std::mutex> lock(lock_);
  auto                        id = ++next_id_;
  subscribers_.emplace(id, std::move(subscriber));
  return id;
}

void ConfigService::Unsubscribe(subscription_t id) {
  std::lock_guard<std::mutex> lock(lock_);
  subscribers_.erase(id);
}
};  // namespace gallup
