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

#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <vector>

#include "queue/gallery_queue_item.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/queue_store.hpp"
#include "storage/service/queue/gallery_service.hpp"
#include "type/type.hpp"

namespace gallup {
class QueueController final : public QueueStore {
 private:
  ConnectionGuard _guard;
  GalleryService  _service;

  // A duckdb connection must not be used from two threads at once
  std::mutex      _conn_lock;
  queue_item_id_t _last_id = 0;

  auto            SelectByPath(const gallery_path_t& path) -> std::optional<GalleryQueueItem>;
  void            LoadLastId();

 public:
  QueueController(ConnectionGuard&& guard);

  auto GetNextQueued(const std::set<gallery_path_t>& exclude)
      -> std::optional<GalleryQueueItem> override;
  auto GetItem(const gallery_path_t& path) -> std::optional<GalleryQueueItem> override;
  auto GetAllItems() -> std::vector<GalleryQueueItem> override;
  void UpdateStatus(const gallery_path_t& path, GalleryStatus status) override;
  void UpsertItems(std::span<GalleryQueueItem> items) override;
  auto RemoveItem(const gallery_path_t& path) -> bool override;
  auto GetStats() -> QueueStats override;
};
};  // namespace gallup
