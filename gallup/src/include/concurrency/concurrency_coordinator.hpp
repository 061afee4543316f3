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
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "concurrency/slot_gate.hpp"
#include "type/type.hpp"

namespace gallup {
class SlotTimeoutError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ActiveUpload {
  queue_item_id_t gallery_id_ = 0;
  host_name_t     host_{};

  auto            operator==(const ActiveUpload& other) const -> bool = default;
};

struct CoordinatorStatistics {
  uint32_t                        global_limit_    = 0;
  uint32_t                        per_host_limit_  = 0;
  size_t                          active_count_    = 0;
  uint64_t                        total_started_   = 0;
  uint64_t                        total_completed_ = 0;
  uint64_t                        total_failed_    = 0;
  std::map<host_name_t, size_t>   active_by_host_{};
};

class ConcurrencyCoordinator;

/**
 * @brief Scoped ownership of one global slot and one per-host slot.
 *
 * Both slots and the active-uploads entry are released exactly once, when the guard is
 * destroyed or Release() is called, whichever comes first.
 */
class SlotGuard {
 private:
  friend class ConcurrencyCoordinator;

  ConcurrencyCoordinator*   owner_ = nullptr;
  std::shared_ptr<SlotGate> global_gate_;
  std::shared_ptr<SlotGate> host_gate_;
  queue_item_id_t           gallery_id_ = 0;
  host_name_t               host_{};

  SlotGuard(ConcurrencyCoordinator* owner, std::shared_ptr<SlotGate> global_gate,
            std::shared_ptr<SlotGate> host_gate, queue_item_id_t gallery_id, host_name_t host);

 public:
  SlotGuard(const SlotGuard&)            = delete;
  SlotGuard& operator=(const SlotGuard&) = delete;
  SlotGuard(SlotGuard&& other) noexcept;
  SlotGuard& operator=(SlotGuard&& other) noexcept;
  ~SlotGuard();

  void Release();
  auto IsHeld() const -> bool { return owner_ != nullptr; }
  auto GetGalleryId() const -> queue_item_id_t { return gallery_id_; }
  auto GetHost() const -> const host_name_t& { return host_; }
};

/**
 * @brief Admission control for uploads: at most global_limit concurrent uploads overall and
 * at most per_host_limit per destination host.
 *
 * Slot bookkeeping, per-host gate creation and statistics counters are guarded by three
 * separate locks, so statistics never contend with admission.
 */
class ConcurrencyCoordinator {
 public:
  static constexpr uint32_t default_global_limit_   = 3;
  static constexpr uint32_t default_per_host_limit_ = 2;

  explicit ConcurrencyCoordinator(uint32_t global_limit   = default_global_limit_,
                                  uint32_t per_host_limit = default_per_host_limit_);

  ConcurrencyCoordinator(const ConcurrencyCoordinator&)            = delete;
  ConcurrencyCoordinator& operator=(const ConcurrencyCoordinator&) = delete;

  /**
   * @brief Block until a global slot and then a per-host slot are both available.
   *
   * @throw SlotTimeoutError when the timeout elapses; no state is mutated in that case
   */
  auto AcquireSlot(queue_item_id_t gallery_id, const host_name_t& host,
                   std::chrono::milliseconds timeout) -> SlotGuard;

  auto CanStartUpload(const host_name_t& host) -> bool;

  auto IsUploadActive(queue_item_id_t gallery_id, const host_name_t& host) const -> bool;
  auto GetActiveUploadCount() const -> size_t;
  auto GetActiveUploadCount(const host_name_t& host) const -> size_t;
  auto GetActiveUploads() const -> std::vector<ActiveUpload>;

  void RecordCompletion(bool success);
  auto GetStatistics() const -> CoordinatorStatistics;

  /**
   * @brief Free slots a new arrival would find: global only, or the smaller of global and
   * per-host when a host is given. Never negative.
   */
  auto GetAvailableSlots(const std::optional<host_name_t>& host = std::nullopt) const -> uint32_t;

  /**
   * @brief Hot-swap the limits.
   *
   * A new global gate replaces the old one: holders keep their slots and release them into
   * the gate they came from, new arrivals only see the new capacity. Gates of hosts that were
   * already seen keep their old per-host capacity; only hosts seen afterwards get the new one.
   */
  void UpdateLimits(std::optional<uint32_t> global_limit, std::optional<uint32_t> per_host_limit);

  auto GetGlobalLimit() const -> uint32_t;
  auto GetPerHostLimit() const -> uint32_t { return per_host_limit_.load(); }

 private:
  friend class SlotGuard;

  auto                      GetGlobalGate() const -> std::shared_ptr<SlotGate>;
  auto                      GetHostGate(const host_name_t& host) -> std::shared_ptr<SlotGate>;
  void ReleaseSlot(SlotGate& global_gate, SlotGate& host_gate, queue_item_id_t gallery_id,
                   const host_name_t& host);

  std::atomic<uint32_t>     per_host_limit_;

  // Guards the global gate pointer and the per-host gate registry
  mutable std::mutex        gate_lock_;
  std::shared_ptr<SlotGate> global_gate_;
  std::unordered_map<host_name_t, std::shared_ptr<SlotGate>> host_gates_;

  mutable std::mutex                                     active_lock_;
  std::set<std::pair<queue_item_id_t, host_name_t>>      active_uploads_;

  mutable std::mutex                                     stats_lock_;
  uint64_t                                               total_started_   = 0;
  uint64_t                                               total_completed_ = 0;
  uint64_t                                               total_failed_    = 0;
};
};  // namespace gallup
