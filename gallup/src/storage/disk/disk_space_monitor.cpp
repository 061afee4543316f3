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

#include "storage/disk/disk_space_monitor.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "utils/log/logger.hpp"

namespace gallup {
auto DiskTierToString(DiskTier tier) -> const char* {
  switch (tier) {
    case DiskTier::OK:
      return "ok";
    case DiskTier::WARNING:
      return "warning";
    case DiskTier::CRITICAL:
      return "critical";
    case DiskTier::EMERGENCY:
      return "emergency";
  }
  return "unknown";
}

static void ValidateThresholds(const DiskThresholds& thresholds) {
  if (!(thresholds.emergency_bytes_ < thresholds.critical_bytes_ &&
        thresholds.critical_bytes_ < thresholds.warning_bytes_)) {
    throw std::invalid_argument("Disk thresholds must satisfy emergency < critical < warning");
  }
}

DiskSpaceMonitor::DiskSpaceMonitor(std::filesystem::path data_dir, std::filesystem::path temp_dir,
                                   DiskThresholds thresholds, SpaceQuery space_query)
    : space_query_(space_query ? std::move(space_query)
                               : SpaceQuery([](const std::filesystem::path& path) {
                                   return static_cast<byte_count_t>(
                                       std::filesystem::space(path).available);
                                 })),
      data_dir_(std::move(data_dir)),
      temp_dir_(std::move(temp_dir)) {
  ValidateThresholds(thresholds);
  warning_bytes_.store(thresholds.warning_bytes_);
  critical_bytes_.store(thresholds.critical_bytes_);
  emergency_bytes_.store(thresholds.emergency_bytes_);
  reserve_path_ = data_dir_ / reserve_file_name_;
  same_device_  = CheckSameDevice(data_dir_, temp_dir_);
}

DiskSpaceMonitor::~DiskSpaceMonitor() { Stop(); }

void DiskSpaceMonitor::Start() {
  {
    std::lock_guard<std::mutex> lock(poll_mtx_);
    if (polling_) {
      return;
    }
    polling_ = true;
  }
  EnsureReserveFile();
  Poll();
  poll_thread_ = std::thread(&DiskSpaceMonitor::PollLoop, this);
}

void DiskSpaceMonitor::Stop() {
  {
    std::lock_guard<std::mutex> lock(poll_mtx_);
    polling_ = false;
  }
  poll_cv_.notify_all();
  if (poll_thread_.joinable()) {
    poll_thread_.join();
  }
}

void DiskSpaceMonitor::PollLoop() {
  std::unique_lock<std::mutex> lock(poll_mtx_);
  while (polling_) {
    // The interval is re-read every round, so a changed interval reschedules the next poll
    auto interval = GetCurrentInterval();
    if (poll_cv_.wait_for(lock, interval, [this] { return !polling_; })) {
      break;
    }
    lock.unlock();
    try {
      Poll();
    } catch (const std::exception& e) {
      Logger::Get("disk")->error("Disk space poll failed: {}", e.what());
    }
    lock.lock();
  }
}

void DiskSpaceMonitor::Poll() {
  auto                  log = Logger::Get("disk");
  std::filesystem::path data_dir;
  std::filesystem::path temp_dir;
  bool                  same_device;
  {
    std::lock_guard<std::mutex> lock(paths_lock_);
    data_dir    = data_dir_;
    temp_dir    = temp_dir_;
    same_device = same_device_;
  }

  byte_count_t data_free = 0;
  byte_count_t temp_free = 0;
  try {
    data_free = space_query_(data_dir);
    temp_free = same_device ? data_free : space_query_(temp_dir);
  } catch (const std::exception& e) {
    log->warn("Disk space check failed: {}", e.what());
    return;
  }
  data_free_.store(data_free);
  temp_free_.store(temp_free);

  const byte_count_t min_free = std::min(data_free, temp_free);
  const DiskTier     new_tier = CalculateTier(min_free);

  // State and the reserve file are settled before any subscriber runs
  const DiskTier old_tier = current_tier_.exchange(new_tier);
  const bool     changed  = new_tier != old_tier;
  if (changed) {
    auto level = new_tier == DiskTier::OK ? spdlog::level::info : spdlog::level::warn;
    log->log(level, "Disk space tier: {} -> {} (data: {}MB, temp: {}MB)",
             DiskTierToString(old_tier), DiskTierToString(new_tier), data_free / kMegabyte,
             temp_free / kMegabyte);
    if (new_tier == DiskTier::EMERGENCY) {
      RequestEmergencySpace();
    }
  }

  const auto new_interval = CalculateInterval(min_free);
  if (new_interval.count() != current_interval_ms_.exchange(new_interval.count())) {
    log->debug("Disk poll interval set to {} ms", new_interval.count());
  }

  std::vector<SpaceUpdatedCallback> space_callbacks;
  std::vector<TierChangedCallback>  tier_callbacks;
  {
    std::lock_guard<std::mutex> lock(callbacks_lock_);
    space_callbacks = space_updated_callbacks_;
    tier_callbacks  = tier_changed_callbacks_;
  }
  for (auto& callback : space_callbacks) {
    try {
      callback(data_free, temp_free);
    } catch (const std::exception& e) {
      log->error("Space-updated subscriber failed: {}", e.what());
    }
  }
  if (changed) {
    for (auto& callback : tier_callbacks) {
      try {
        callback(old_tier, new_tier);
      } catch (const std::exception& e) {
        log->error("Tier-changed subscriber failed: {}", e.what());
      }
    }
  }
}

auto DiskSpaceMonitor::CalculateTier(byte_count_t free_bytes) const -> DiskTier {
  // Thresholds nest, so the order of the checks matters
  if (free_bytes < emergency_bytes_.load()) {
    return DiskTier::EMERGENCY;
  } else if (free_bytes < critical_bytes_.load()) {
    return DiskTier::CRITICAL;
  } else if (free_bytes < warning_bytes_.load()) {
    return DiskTier::WARNING;
  }
  return DiskTier::OK;
}

auto DiskSpaceMonitor::CalculateInterval(byte_count_t free_bytes) const
    -> std::chrono::milliseconds {
  const byte_count_t warning = warning_bytes_.load();
  if (free_bytes > warning * 2) {
    return interval_comfortable_;
  } else if (free_bytes > warning) {
    return interval_approaching_;
  } else if (free_bytes > critical_bytes_.load()) {
    return interval_danger_;
  }
  return interval_emergency_;
}

auto DiskSpaceMonitor::CanStartUpload() const -> bool {
  const DiskTier tier = current_tier_.load();
  return tier == DiskTier::OK || tier == DiskTier::WARNING;
}

auto DiskSpaceMonitor::CanCreateArchive(byte_count_t estimated_bytes) const -> bool {
  return temp_free_.load() > estimated_bytes + critical_bytes_.load();
}

auto DiskSpaceMonitor::RequestEmergencySpace() -> byte_count_t {
  auto                        reserve_path = GetReservePath();
  std::lock_guard<std::mutex> lock(reserve_lock_);
  std::error_code             ec;
  if (!std::filesystem::exists(reserve_path, ec)) {
    return 0;
  }
  const auto size = std::filesystem::file_size(reserve_path, ec);
  if (ec) {
    Logger::Get("disk")->error("Failed to stat reserve file {}: {}", reserve_path.string(),
                               ec.message());
    return 0;
  }
  if (!std::filesystem::remove(reserve_path, ec)) {
    if (ec) {
      Logger::Get("disk")->error("Failed to delete reserve file {}: {}", reserve_path.string(),
                                 ec.message());
    }
    return 0;
  }
  Logger::Get("disk")->warn("Deleted disk reserve file, freed {}MB", size / kMegabyte);
  return static_cast<byte_count_t>(size);
}

auto DiskSpaceMonitor::EnsureReserveFile() -> bool {
  auto                        reserve_path = GetReservePath();
  std::lock_guard<std::mutex> lock(reserve_lock_);
  std::error_code             ec;
  if (std::filesystem::exists(reserve_path, ec)) {
    return true;
  }
  std::ofstream file(reserve_path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    Logger::Get("disk")->warn("Could not create disk reserve file at {}", reserve_path.string());
    return false;
  }
  const std::vector<char> chunk(kMegabyte, '\0');
  for (byte_count_t written = 0; written < reserve_size_; written += kMegabyte) {
    file.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
  }
  file.close();
  if (!file) {
    Logger::Get("disk")->warn("Could not fill disk reserve file at {}", reserve_path.string());
    std::filesystem::remove(reserve_path, ec);
    return false;
  }
  Logger::Get("disk")->info("Created {}MB disk reserve at {}", reserve_size_ / kMegabyte,
                            reserve_path.string());
  return true;
}

void DiskSpaceMonitor::UpdateThresholds(const DiskThresholds& thresholds) {
  ValidateThresholds(thresholds);
  warning_bytes_.store(thresholds.warning_bytes_);
  critical_bytes_.store(thresholds.critical_bytes_);
  emergency_bytes_.store(thresholds.emergency_bytes_);
}

void DiskSpaceMonitor::UpdatePaths(std::filesystem::path data_dir, std::filesystem::path temp_dir) {
  const bool                  same_device = CheckSameDevice(data_dir, temp_dir);
  std::lock_guard<std::mutex> lock(paths_lock_);
  data_dir_     = std::move(data_dir);
  temp_dir_     = std::move(temp_dir);
  reserve_path_ = data_dir_ / reserve_file_name_;
  same_device_  = same_device;
}

void DiskSpaceMonitor::OnTierChanged(TierChangedCallback callback) {
  std::lock_guard<std::mutex> lock(callbacks_lock_);
  tier_changed_callbacks_.push_back(std::move(callback));
}

void DiskSpaceMonitor::OnSpaceUpdated(SpaceUpdatedCallback callback) {
  std::lock_guard<std::mutex> lock(callbacks_lock_);
  space_updated_callbacks_.push_back(std::move(callback));
}

auto DiskSpaceMonitor::GetThresholds() const -> DiskThresholds {
  return {warning_bytes_.load(), critical_bytes_.load(), emergency_bytes_.load()};
}

auto DiskSpaceMonitor::GetReservePath() const -> std::filesystem::path {
  std::lock_guard<std::mutex> lock(paths_lock_);
  return reserve_path_;
}

auto DiskSpaceMonitor::IsSameDevice() const -> bool {
  std::lock_guard<std::mutex> lock(paths_lock_);
  return same_device_;
}

auto DiskSpaceMonitor::CheckSameDevice(const std::filesystem::path& a,
                                       const std::filesystem::path& b) -> bool {
  struct stat stat_a {};
  struct stat stat_b {};
  // Can't tell, monitor both
  if (stat(a.string().c_str(), &stat_a) != 0 || stat(b.string().c_str(), &stat_b) != 0) {
    return false;
  }
  return stat_a.st_dev == stat_b.st_dev;
}
};  // namespace gallup
