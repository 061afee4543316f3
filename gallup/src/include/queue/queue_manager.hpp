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

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "queue/gallery_queue_item.hpp"
#include "queue/gallery_scanner.hpp"
#include "storage/queue_store.hpp"
#include "type/type.hpp"
#include "upload/notification_hub.hpp"

namespace gallup {
/**
 * @brief What one upload run leaves behind on its queue item.
 */
struct UploadRecord {
  std::set<std::string>   uploaded_files_{};
  std::vector<FailedFile> failed_files_{};
  uint32_t                total_images_   = 0;
  byte_count_t            uploaded_bytes_ = 0;
  gallery_id_t            gallery_id_{};
  std::string             gallery_url_{};
  std::string             error_message_{};
};

/**
 * @brief Thread-safe view over the queue. Every status change of an item goes through here,
 * is validated against the transition table, persisted and announced.
 */
class QueueManager {
 public:
  explicit QueueManager(std::shared_ptr<QueueStore>      store,
                        std::shared_ptr<NotificationHub> hub = nullptr);

  /**
   * @brief Add a gallery folder to the queue in the queued state.
   *
   * @throw std::invalid_argument when the path is already queued
   */
  auto AddGallery(const gallery_path_t& path, const std::string& name, const host_name_t& host = {},
                  const std::string& template_name = {}) -> GalleryQueueItem;

  /**
   * @brief Count the images of a queued item: queued -> scanning -> ready, or failed when the
   * folder is missing or holds no supported image.
   */
  auto ScanItem(const gallery_path_t& path, const GalleryScanner& scanner) -> GalleryQueueItem;

  // ready | paused | incomplete | failed -> queued
  auto StartItem(const gallery_path_t& path) -> GalleryQueueItem;
  // completed -> queued, forgetting the previous run
  auto RerunItem(const gallery_path_t& path) -> GalleryQueueItem;

  /**
   * @brief Hand the next queued item to exactly one caller. The item stays claimed, and is
   * skipped by later calls, until ReleaseClaim().
   */
  auto ClaimNextQueued() -> std::optional<GalleryQueueItem>;
  void ReleaseClaim(const gallery_path_t& path);
  auto IsClaimed(const gallery_path_t& path) const -> bool;

  /**
   * @brief Validated status change.
   *
   * @throw InvalidTransitionError when the transition table forbids it
   * @throw std::runtime_error when the item does not exist
   */
  auto UpdateItemStatus(const gallery_path_t& path, GalleryStatus status, bool allow_rerun = false)
      -> GalleryQueueItem;
  void UpdateProgress(const gallery_path_t& path, uint32_t uploaded_images, uint32_t total_images);

  auto MarkCompleted(const gallery_path_t& path, const UploadRecord& record) -> GalleryQueueItem;
  auto MarkIncomplete(const gallery_path_t& path, const UploadRecord& record) -> GalleryQueueItem;
  auto MarkPaused(const gallery_path_t& path, const UploadRecord& record) -> GalleryQueueItem;
  // Failed run that keeps whatever it managed to upload for the next attempt
  auto MarkFailed(const gallery_path_t& path, const UploadRecord& record) -> GalleryQueueItem;
  auto MarkUploadFailed(const gallery_path_t& path, const std::string& message,
                        const std::vector<FailedFile>& failed_files = {}) -> GalleryQueueItem;

  /**
   * @brief Delete an item. Refused (returns false) while a worker holds it.
   */
  auto RemoveItem(const gallery_path_t& path) -> bool;

  auto GetItem(const gallery_path_t& path) const -> std::optional<GalleryQueueItem>;
  auto GetAllItems() const -> std::vector<GalleryQueueItem>;
  auto GetQueueStats() const -> QueueStats;

 private:
  auto LoadItem(const gallery_path_t& path) const -> GalleryQueueItem;
  void Transition(GalleryQueueItem& item, GalleryStatus status, bool allow_rerun = false);
  auto FinishUpload(const gallery_path_t& path, GalleryStatus status, const UploadRecord& record)
      -> GalleryQueueItem;
  void Persist(GalleryQueueItem& item);

  std::shared_ptr<QueueStore>      store_;
  std::shared_ptr<NotificationHub> hub_;

  // Serializes read-modify-write cycles on items
  mutable std::mutex               item_lock_;

  mutable std::mutex               claim_lock_;
  std::set<gallery_path_t>         claimed_;
};
};  // namespace gallup
