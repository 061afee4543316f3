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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "type/type.hpp"

namespace gallup {
enum class DiskTier : uint8_t { OK = 0, WARNING = 1, CRITICAL = 2, EMERGENCY = 3 };

auto DiskTierToString(DiskTier tier) -> const char*;

constexpr byte_count_t kMegabyte = 1024ull * 1024ull;

struct DiskThresholds {
  byte_count_t warning_bytes_   = 2048 * kMegabyte;
  byte_count_t critical_bytes_  = 512 * kMegabyte;
  byte_count_t emergency_bytes_ = 100 * kMegabyte;

  static auto  FromMegabytes(uint64_t warning_mb, uint64_t critical_mb, uint64_t emergency_mb)
      -> DiskThresholds {
    return {warning_mb * kMegabyte, critical_mb * kMegabyte, emergency_mb * kMegabyte};
  }
};

/**
 * @brief Free-space admission control for the data and temp directories.
 *
 * A poll thread samples free space, classifies min(data_free, temp_free) into a tier and
 * adapts its own interval: rare sampling while space is abundant, rapid when it is scarce.
 * Entering the emergency tier deletes a 20 MB reserve file kept beside the database; the file
 * is only (re)created by Start().
 *
 * Tier, interval and thresholds are written by the poller and read from any worker thread.
 */
class DiskSpaceMonitor {
 public:
  using SpaceQuery           = std::function<byte_count_t(const std::filesystem::path&)>;
  using TierChangedCallback  = std::function<void(DiskTier old_tier, DiskTier new_tier)>;
  using SpaceUpdatedCallback = std::function<void(byte_count_t data_free, byte_count_t temp_free)>;

  static constexpr byte_count_t              reserve_size_      = 20 * kMegabyte;
  static constexpr const char*               reserve_file_name_ = "disk_reserve.bin";

  static constexpr std::chrono::milliseconds interval_comfortable_{60'000};  // > 2x warning
  static constexpr std::chrono::milliseconds interval_approaching_{15'000};  // > warning
  static constexpr std::chrono::milliseconds interval_danger_{5'000};        // > critical
  static constexpr std::chrono::milliseconds interval_emergency_{2'000};     // <= critical

  DiskSpaceMonitor(std::filesystem::path data_dir, std::filesystem::path temp_dir,
                   DiskThresholds thresholds = {}, SpaceQuery space_query = nullptr);
  ~DiskSpaceMonitor();

  DiskSpaceMonitor(const DiskSpaceMonitor&)            = delete;
  DiskSpaceMonitor& operator=(const DiskSpaceMonitor&) = delete;

  void Start();
  void Stop();

  /**
   * @brief Sample free space once, update tier and interval, fire callbacks.
   *
   * A failed read is logged and the poll is skipped; tier and interval keep their values.
   */
  void Poll();

  auto CalculateTier(byte_count_t free_bytes) const -> DiskTier;
  auto CalculateInterval(byte_count_t free_bytes) const -> std::chrono::milliseconds;

  auto CanStartUpload() const -> bool;
  auto CanCreateArchive(byte_count_t estimated_bytes) const -> bool;

  /**
   * @brief Delete the reserve file.
   *
   * @return bytes freed, 0 if the file was already gone
   */
  auto RequestEmergencySpace() -> byte_count_t;
  auto EnsureReserveFile() -> bool;

  void UpdateThresholds(const DiskThresholds& thresholds);
  void UpdatePaths(std::filesystem::path data_dir, std::filesystem::path temp_dir);

  void OnTierChanged(TierChangedCallback callback);
  void OnSpaceUpdated(SpaceUpdatedCallback callback);

  auto GetCurrentTier() const -> DiskTier { return current_tier_.load(); }
  auto GetCurrentInterval() const -> std::chrono::milliseconds {
    return std::chrono::milliseconds(current_interval_ms_.load());
  }
  auto GetDataFree() const -> byte_count_t { return data_free_.load(); }
  auto GetTempFree() const -> byte_count_t { return temp_free_.load(); }
  auto GetThresholds() const -> DiskThresholds;
  auto GetReservePath() const -> std::filesystem::path;
  auto IsSameDevice() const -> bool;

 private:
  void                                PollLoop();
  static auto                         CheckSameDevice(const std::filesystem::path& a,
                                                      const std::filesystem::path& b) -> bool;

  SpaceQuery                          space_query_;

  mutable std::mutex                  paths_lock_;
  std::filesystem::path               data_dir_;
  std::filesystem::path               temp_dir_;
  std::filesystem::path               reserve_path_;
  bool                                same_device_ = false;

  std::atomic<byte_count_t>           warning_bytes_;
  std::atomic<byte_count_t>           critical_bytes_;
  std::atomic<byte_count_t>           emergency_bytes_;

  std::atomic<DiskTier>               current_tier_{DiskTier::OK};
  std::atomic<int64_t>                current_interval_ms_{interval_comfortable_.count()};
  std::atomic<byte_count_t>           data_free_{0};
  std::atomic<byte_count_t>           temp_free_{0};

  // Serializes reserve creation/deletion against manual RequestEmergencySpace()
  std::mutex                          reserve_lock_;

  std::mutex                          callbacks_lock_;
  std::vector<TierChangedCallback>    tier_changed_callbacks_;
  std::vector<SpaceUpdatedCallback>   space_updated_callbacks_;

  std::mutex                          poll_mtx_;
  std::condition_variable             poll_cv_;
  bool                                polling_ = false;
  std::thread                         poll_thread_;
};
};  // namespace gallup
