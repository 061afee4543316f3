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

#include "utils/bandwidth/bandwidth_tracker.hpp"

#include <algorithm>

namespace gallup {
BandwidthTracker::BandwidthTracker(std::chrono::milliseconds window, ClockFunc clock)
    : window_(window), clock_(clock ? std::move(clock) : ClockFunc([] { return Clock::now(); })) {
  started_ = clock_();
}

void BandwidthTracker::EvictExpired(Clock::time_point now) {
  while (!samples_.empty() && now - samples_.front().time_ > window_) {
    bytes_in_window_ -= samples_.front().bytes_;
    samples_.pop_front();
  }
}

auto BandwidthTracker::RateLocked(Clock::time_point now) const -> double {
  auto elapsed = std::min<Clock::duration>(now - started_, window_);
  auto seconds = std::chrono::duration<double>(elapsed).count();
  if (seconds <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(bytes_in_window_) / seconds;
}

void BandwidthTracker::AddSample(byte_count_t bytes) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        now = clock_();
  EvictExpired(now);
  samples_.push_back({now, bytes});
  bytes_in_window_ += bytes;
  total_bytes_ += bytes;
  // Sub-second spans give meaningless spikes
  if (now - started_ >= std::chrono::seconds(1)) {
    peak_rate_ = std::max(peak_rate_, RateLocked(now));
  }
}

auto BandwidthTracker::GetCurrentRate() -> double {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        now = clock_();
  EvictExpired(now);
  return RateLocked(now);
}

auto BandwidthTracker::GetPeakRate() const -> double {
  std::lock_guard<std::mutex> lock(mtx_);
  return peak_rate_;
}

auto BandwidthTracker::GetTotalBytes() const -> byte_count_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return total_bytes_;
}

void BandwidthTracker::Reset() {
  std::lock_guard<std::mutex> lock(mtx_);
  samples_.clear();
  bytes_in_window_ = 0;
  total_bytes_     = 0;
  peak_rate_       = 0.0;
  started_         = clock_();
}
};  // namespace gallup
