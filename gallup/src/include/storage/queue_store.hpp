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

#include <optional>
#include <set>
#include <span>
#include <vector>

#include "queue/gallery_queue_item.hpp"
#include "type/type.hpp"

namespace gallup {
/**
 * @brief Durable storage of queue items. Implementations must give read-after-write
 * consistency within one process and be safe to call from several threads.
 */
class QueueStore {
 public:
  virtual ~QueueStore() = default;

  /**
   * @brief Oldest queued item whose path is not in exclude, ordered by (added_time, item_id)
   */
  virtual auto GetNextQueued(const std::set<gallery_path_t>& exclude)
      -> std::optional<GalleryQueueItem>                                        = 0;
  virtual auto GetItem(const gallery_path_t& path) -> std::optional<GalleryQueueItem> = 0;
  virtual auto GetAllItems() -> std::vector<GalleryQueueItem>                   = 0;
  virtual void UpdateStatus(const gallery_path_t& path, GalleryStatus status)   = 0;
  /**
   * @brief Insert or replace items by path. Items with item_id_ == 0 get a fresh id written
   * back into the span.
   */
  virtual void UpsertItems(std::span<GalleryQueueItem> items)                   = 0;
  virtual auto RemoveItem(const gallery_path_t& path) -> bool                   = 0;
  virtual auto GetStats() -> QueueStats                                         = 0;
};
};  // namespace gallup
