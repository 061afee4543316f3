#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "storage/disk/disk_space_monitor.hpp"

namespace gallup {
class DiskSpaceMonitorTests : public ::testing::Test {
 protected:
  std::filesystem::path     root_;
  std::filesystem::path     data_dir_;
  std::filesystem::path     temp_dir_;

  // Free space the fake space query reports, in bytes
  std::atomic<byte_count_t> free_bytes_{5000 * kMegabyte};
  std::atomic<bool>         space_query_fails_{false};
  std::atomic<int>          space_query_calls_{0};

  void                      SetUp() override {
    root_ = std::filesystem::temp_directory_path() /
            ("gallup_disk_test_" +
             std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::remove_all(root_);
    data_dir_ = root_ / "data";
    temp_dir_ = root_ / "temp";
    std::filesystem::create_directories(data_dir_);
    std::filesystem::create_directories(temp_dir_);
  }

  void TearDown() override { std::filesystem::remove_all(root_); }

  void SetFreeMegabytes(uint64_t megabytes) { free_bytes_ = megabytes * kMegabyte; }

  auto MakeMonitor(DiskThresholds thresholds = {}) -> std::unique_ptr<DiskSpaceMonitor> {
    return std::make_unique<DiskSpaceMonitor>(
        data_dir_, temp_dir_, thresholds, [this](const std::filesystem::path&) -> byte_count_t {
          ++space_query_calls_;
          if (space_query_fails_) {
            throw std::runtime_error("statvfs failed");
          }
          return free_bytes_.load();
        });
  }
};
}  // namespace gallup
