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

#include "concurrency/concurrency_coordinator.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <stdexcept>

#include "utils/log/logger.hpp"

namespace gallup {
namespace {
auto Free(const SlotGate& gate) -> uint32_t {
  const auto limit  = gate.GetLimit();
  const auto in_use = gate.GetInUse();
  return in_use >= limit ? 0 : limit - in_use;
}
};  // namespace

SlotGuard::SlotGuard(ConcurrencyCoordinator* owner, std::shared_ptr<SlotGate> global_gate,
                     std::shared_ptr<SlotGate> host_gate, queue_item_id_t gallery_id,
                     host_name_t host)
    : owner_(owner),
      global_gate_(std::move(global_gate)),
      host_gate_(std::move(host_gate)),
      gallery_id_(gallery_id),
      host_(std::move(host)) {}

SlotGuard::SlotGuard(SlotGuard&& other) noexcept
    : owner_(other.owner_),
      global_gate_(std::move(other.global_gate_)),
      host_gate_(std::move(other.host_gate_)),
      gallery_id_(other.gallery_id_),
      host_(std::move(other.host_)) {
  other.owner_ = nullptr;
}

SlotGuard& SlotGuard::operator=(SlotGuard&& other) noexcept {
  if (this != &other) {
    Release();
    owner_       = other.owner_;
    global_gate_ = std::move(other.global_gate_);
    host_gate_   = std::move(other.host_gate_);
    gallery_id_  = other.gallery_id_;
    host_        = std::move(other.host_);
    other.owner_ = nullptr;
  }
  return *this;
}

SlotGuard::~SlotGuard() { Release(); }

void SlotGuard::Release() {
  if (owner_ == nullptr) {
    return;
  }
  auto* owner = owner_;
  owner_      = nullptr;
  owner->ReleaseSlot(*global_gate_, *host_gate_, gallery_id_, host_);
  global_gate_.reset();
  host_gate_.reset();
}

ConcurrencyCoordinator::ConcurrencyCoordinator(uint32_t global_limit, uint32_t per_host_limit)
    : per_host_limit_(per_host_limit), global_gate_(std::make_shared<SlotGate>(global_limit)) {}

auto ConcurrencyCoordinator::GetGlobalGate() const -> std::shared_ptr<SlotGate> {
  std::lock_guard<std::mutex> lock(gate_lock_);
  return global_gate_;
}

auto ConcurrencyCoordinator::GetHostGate(const host_name_t& host) -> std::shared_ptr<SlotGate> {
  std::lock_guard<std::mutex> lock(gate_lock_);
  auto                        it = host_gates_.find(host);
  if (it != host_gates_.end()) {
    return it->second;
  }
  auto gate = std::make_shared<SlotGate>(per_host_limit_.load());
  host_gates_.emplace(host, gate);
  return gate;
}

auto ConcurrencyCoordinator::AcquireSlot(queue_item_id_t gallery_id, const host_name_t& host,
                                         std::chrono::milliseconds timeout) -> SlotGuard {
  if (IsUploadActive(gallery_id, host)) {
    throw std::logic_error(
        std::format("Upload of gallery {} to {} already holds a slot", gallery_id, host));
  }
  const auto deadline    = std::chrono::steady_clock::now() + timeout;
  auto       global_gate = GetGlobalGate();
  auto       host_gate   = GetHostGate(host);

  // Fixed order, global first, so waiters on different hosts never invert
  if (!global_gate->TryAcquireUntil(deadline)) {
    throw SlotTimeoutError(std::format("Timed out waiting for a global upload slot ({} ms)",
                                       timeout.count()));
  }
  if (!host_gate->TryAcquireUntil(deadline)) {
    global_gate->Release();
    throw SlotTimeoutError(
        std::format("Timed out waiting for an upload slot on {} ({} ms)", host, timeout.count()));
  }

  {
    std::lock_guard<std::mutex> lock(active_lock_);
    active_uploads_.emplace(gallery_id, host);
  }
  {
    std::lock_guard<std::mutex> lock(stats_lock_);
    ++total_started_;
  }
  Logger::Get("concurrency")
      ->debug("Slot acquired for gallery {} on {} (global {}/{})", gallery_id, host,
              global_gate->GetInUse(), global_gate->GetLimit());
  return SlotGuard(this, std::move(global_gate), std::move(host_gate), gallery_id, host);
}

void ConcurrencyCoordinator::ReleaseSlot(SlotGate& global_gate, SlotGate& host_gate,
                                         queue_item_id_t gallery_id, const host_name_t& host) {
  {
    std::lock_guard<std::mutex> lock(active_lock_);
    active_uploads_.erase({gallery_id, host});
  }
  // Reverse order of acquisition
  host_gate.Release();
  global_gate.Release();
  Logger::Get("concurrency")->debug("Slot released for gallery {} on {}", gallery_id, host);
}

auto ConcurrencyCoordinator::CanStartUpload(const host_name_t& host) -> bool {
  if (!GetGlobalGate()->HasCapacity()) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(gate_lock_);
    auto                        it = host_gates_.find(host);
    if (it != host_gates_.end()) {
      return it->second->HasCapacity();
    }
  }
  return per_host_limit_.load() > 0;
}

auto ConcurrencyCoordinator::IsUploadActive(queue_item_id_t gallery_id,
                                            const host_name_t& host) const -> bool {
  std::lock_guard<std::mutex> lock(active_lock_);
  return active_uploads_.contains({gallery_id, host});
}

auto ConcurrencyCoordinator::GetActiveUploadCount() const -> size_t {
  std::lock_guard<std::mutex> lock(active_lock_);
  return active_uploads_.size();
}

auto ConcurrencyCoordinator::GetActiveUploadCount(const host_name_t& host) const -> size_t {
  std::lock_guard<std::mutex> lock(active_lock_);
  size_t                      count = 0;
  for (const auto& [gallery_id, active_host] : active_uploads_) {
    if (active_host == host) {
      ++count;
    }
  }
  return count;
}

auto ConcurrencyCoordinator::GetActiveUploads() const -> std::vector<ActiveUpload> {
  std::lock_guard<std::mutex> lock(active_lock_);
  std::vector<ActiveUpload>   uploads;
  uploads.reserve(active_uploads_.size());
  for (const auto& [gallery_id, host] : active_uploads_) {
    uploads.push_back(ActiveUpload{gallery_id, host});
  }
  return uploads;
}

void ConcurrencyCoordinator::RecordCompletion(bool success) {
  std::lock_guard<std::mutex> lock(stats_lock_);
  if (success) {
    ++total_completed_;
  } else {
    ++total_failed_;
  }
}

auto ConcurrencyCoordinator::GetStatistics() const -> CoordinatorStatistics {
  CoordinatorStatistics stats;
  stats.global_limit_   = GetGlobalLimit();
  stats.per_host_limit_ = per_host_limit_.load();
  {
    std::lock_guard<std::mutex> lock(active_lock_);
    stats.active_count_ = active_uploads_.size();
    for (const auto& [gallery_id, host] : active_uploads_) {
      ++stats.active_by_host_[host];
    }
  }
  {
    std::lock_guard<std::mutex> lock(stats_lock_);
    stats.total_started_   = total_started_;
    stats.total_completed_ = total_completed_;
    stats.total_failed_    = total_failed_;
  }
  return stats;
}

auto ConcurrencyCoordinator::GetAvailableSlots(const std::optional<host_name_t>& host) const
    -> uint32_t {
  auto     global_gate = GetGlobalGate();
  uint32_t available   = Free(*global_gate);
  if (!host.has_value()) {
    return available;
  }
  std::lock_guard<std::mutex> lock(gate_lock_);
  auto                        it = host_gates_.find(*host);
  const uint32_t host_free = it == host_gates_.end() ? per_host_limit_.load() : Free(*it->second);
  return std::min(available, host_free);
}

auto ConcurrencyCoordinator::GetGlobalLimit() const -> uint32_t {
  return GetGlobalGate()->GetLimit();
}

void ConcurrencyCoordinator::UpdateLimits(std::optional<uint32_t> global_limit,
                                          std::optional<uint32_t> per_host_limit) {
  if (global_limit.has_value()) {
    // Holders keep a reference to the gate they acquired from and release into it
    auto gate = std::make_shared<SlotGate>(*global_limit);
    std::lock_guard<std::mutex> lock(gate_lock_);
    global_gate_ = std::move(gate);
  }
  if (per_host_limit.has_value()) {
    // Existing host gates are intentionally left at their old capacity
    per_host_limit_.store(*per_host_limit);
  }
  Logger::Get("concurrency")
      ->info("Upload limits updated: global {}, per host {}", GetGlobalLimit(),
             per_host_limit_.load());
}
};  // namespace gallup
