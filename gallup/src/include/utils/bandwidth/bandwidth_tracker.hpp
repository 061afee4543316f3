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

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>

#include "type/type.hpp"

namespace gallup {
/**
 * @brief Rolling-window transfer rate estimator.
 *
 * current rate = bytes sampled inside the window / time covered by the window (or the time
 * since the tracker started, whichever is shorter).
 */
class BandwidthTracker {
 public:
  using Clock     = std::chrono::steady_clock;
  using ClockFunc = std::function<Clock::time_point()>;

 private:
  struct Sample {
    Clock::time_point time_;
    byte_count_t      bytes_;
  };

  mutable std::mutex        mtx_;
  std::chrono::milliseconds window_;
  ClockFunc                 clock_;
  Clock::time_point         started_;
  std::deque<Sample>        samples_;
  byte_count_t              bytes_in_window_ = 0;
  byte_count_t              total_bytes_     = 0;
  double                    peak_rate_       = 0.0;

  void                      EvictExpired(Clock::time_point now);
  auto                      RateLocked(Clock::time_point now) const -> double;

 public:
  static constexpr std::chrono::milliseconds default_window_{10'000};

  explicit BandwidthTracker(std::chrono::milliseconds window = default_window_,
                            ClockFunc                 clock  = nullptr);

  void AddSample(byte_count_t bytes);

  // Bytes per second
  auto GetCurrentRate() -> double;
  auto GetPeakRate() const -> double;
  auto GetTotalBytes() const -> byte_count_t;

  void Reset();
};
};  // namespace gallup
