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
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace gallup {
/**
 * @brief Counting admission gate with a timed acquire. New arrivals are admitted only while
 * in_use < limit; the limit is fixed for the gate's lifetime.
 */
class SlotGate {
 private:
  mutable std::mutex      mtx_;
  std::condition_variable released_cv_;
  const uint32_t          limit_;
  uint32_t                in_use_ = 0;

 public:
  explicit SlotGate(uint32_t limit) : limit_(limit) {}

  auto TryAcquireUntil(std::chrono::steady_clock::time_point deadline) -> bool;
  void Release();

  auto HasCapacity() const -> bool;
  auto GetLimit() const -> uint32_t;
  auto GetInUse() const -> uint32_t;
};
};  // namespace gallup
