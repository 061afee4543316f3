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

#include "concurrency/slot_gate.hpp"

#include <mutex>
#include <stdexcept>

namespace gallup {
auto SlotGate::TryAcquireUntil(std::chrono::steady_clock::time_point deadline) -> bool {
  std::unique_lock<std::mutex> lock(mtx_);
  if (!released_cv_.wait_until(lock, deadline, [this] { return in_use_ < limit_; })) {
    return false;
  }
  ++in_use_;
  return true;
}

void SlotGate::Release() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (in_use_ == 0) {
      throw std::logic_error("SlotGate released more times than acquired");
    }
    --in_use_;
  }
  released_cv_.notify_all();
}

auto SlotGate::HasCapacity() const -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  return in_use_ < limit_;
}

auto SlotGate::GetLimit() const -> uint32_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return limit_;
}

auto SlotGate::GetInUse() const -> uint32_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return in_use_;
}
};  // namespace gallup
