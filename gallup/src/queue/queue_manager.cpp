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

#include "queue/queue_manager.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "utils/clock/time_provider.hpp"
#include "utils/log/logger.hpp"

namespace gallup {
namespace {
auto IsTerminalRun(GalleryStatus status) -> bool {
  return status == GalleryStatus::COMPLETED || status == GalleryStatus::INCOMPLETE ||
         status == GalleryStatus::FAILED || status == GalleryStatus::PAUSED;
}
};  // namespace

QueueManager::QueueManager(std::shared_ptr<QueueStore> store, std::shared_ptr<NotificationHub> hub)
    : store_(std::move(store)), hub_(std::move(hub)) {
  if (!store_) {
    throw std::invalid_argument("QueueManager requires a queue store");
  }
}

auto QueueManager::LoadItem(const gallery_path_t& path) const -> GalleryQueueItem {
  auto item = store_->GetItem(path);
  if (!item.has_value()) {
    throw std::runtime_error("Queue item not found: " + path.string());
  }
  return std::move(*item);
}

void QueueManager::Persist(GalleryQueueItem& item) {
  store_->UpsertItems(std::span<GalleryQueueItem>(&item, 1));
}

/**
 * @brief Apply a status change to an in-memory item and stamp its timestamps.
 *
 * @param item
 * @param status
 * @param allow_rerun
 */
void QueueManager::Transition(GalleryQueueItem& item, GalleryStatus status, bool allow_rerun) {
  if (!IsValidTransition(item.status_, status, allow_rerun)) {
    throw InvalidTransitionError(item.status_, status);
  }
  const auto previous = item.status_;
  item.status_        = status;
  if (status == GalleryStatus::UPLOADING) {
    item.start_time_ = TimeProvider::NowSeconds();
    item.end_time_   = 0;
    item.error_message_.clear();
  } else if (IsTerminalRun(status)) {
    item.end_time_ = TimeProvider::NowSeconds();
  }
  Logger::Get("queue")->info("{}: {} -> {}", item.path_.string(), GalleryStatusToString(previous),
                             GalleryStatusToString(status));
}

auto QueueManager::AddGallery(const gallery_path_t& path, const std::string& name,
                              const host_name_t& host, const std::string& template_name)
    -> GalleryQueueItem {
  const auto                  absolute = std::filesystem::absolute(path).lexically_normal();

  GalleryQueueItem            item;
  {
    std::lock_guard<std::mutex> lock(item_lock_);
    if (store_->GetItem(absolute).has_value()) {
      throw std::invalid_argument("Gallery already queued: " + absolute.string());
    }
    item.path_          = absolute;
    item.name_          = name.empty() ? absolute.filename().string() : name;
    item.status_        = GalleryStatus::QUEUED;
    item.host_          = host;
    item.template_name_ = template_name;
    item.added_time_    = TimeProvider::NowSeconds();
    Persist(item);
  }
  Logger::Get("queue")->info("Queued gallery {} ({})", item.name_, item.path_.string());
  if (hub_) hub_->PublishStatus(item.path_, item.status_);
  return item;
}

auto QueueManager::ScanItem(const gallery_path_t& path, const GalleryScanner& scanner)
    -> GalleryQueueItem {
  {
    std::lock_guard<std::mutex> lock(item_lock_);
    auto                        item = LoadItem(path);
    Transition(item, GalleryStatus::SCANNING);
    Persist(item);
  }
  if (hub_) hub_->PublishStatus(path, GalleryStatus::SCANNING);

  ScanResult  scanned;
  std::string failure;
  try {
    scanned = scanner.Scan(path);
    if (scanned.image_count_ == 0) {
      failure = "No supported images in " + path.string();
    }
  } catch (const std::exception& e) {
    failure = e.what();
  }

  GalleryQueueItem item;
  {
    std::lock_guard<std::mutex> lock(item_lock_);
    item = LoadItem(path);
    if (failure.empty()) {
      Transition(item, GalleryStatus::READY);
      item.total_images_    = scanned.image_count_;
      item.uploaded_images_ = std::min(item.uploaded_images_, item.total_images_);
      item.cover_path_      = scanned.images_.front().string();
    } else {
      Transition(item, GalleryStatus::FAILED);
      item.error_message_ = failure;
    }
    Persist(item);
  }
  if (!failure.empty()) {
    Logger::Get("queue")->error("Scan of {} failed: {}", path.string(), failure);
    if (hub_) hub_->PublishLog(path, failure);
  }
  if (hub_) hub_->PublishStatus(path, item.status_);
  return item;
}

auto QueueManager::StartItem(const gallery_path_t& path) -> GalleryQueueItem {
  GalleryQueueItem item;
  {
    std::lock_guard<std::mutex> lock(item_lock_);
    item = LoadItem(path);
    if (item.status_ == GalleryStatus::QUEUED) {
      return item;
    }
    Transition(item, GalleryStatus::QUEUED);
    Persist(item);
  }
  if (hub_) hub_->PublishStatus(path, item.status_);
  return item;
}

auto QueueManager::RerunItem(const gallery_path_t& path) -> GalleryQueueItem {
  GalleryQueueItem item;
  {
    std::lock_guard<std::mutex> lock(item_lock_);
    item = LoadItem(path);
    Transition(item, GalleryStatus::QUEUED, true);
    item.uploaded_files_.clear();
    item.failed_files_.clear();
    item.uploaded_images_ = 0;
    item.uploaded_bytes_  = 0;
    item.error_message_.clear();
    Persist(item);
  }
  if (hub_) hub_->PublishStatus(path, item.status_);
  return item;
}

auto QueueManager::ClaimNextQueued() -> std::optional<GalleryQueueItem> {
  std::lock_guard<std::mutex> lock(claim_lock_);
  auto                        next = store_->GetNextQueued(claimed_);
  if (next.has_value()) {
    claimed_.insert(next->path_);
  }
  return next;
}

void QueueManager::ReleaseClaim(const gallery_path_t& path) {
  std::lock_guard<std::mutex> lock(claim_lock_);
  claimed_.erase(path);
}

auto QueueManager::IsClaimed(const gallery_path_t& path) const -> bool {
  std::lock_guard<std::mutex> lock(claim_lock_);
  return claimed_.contains(path);
}

auto QueueManager::UpdateItemStatus(const gallery_path_t& path, GalleryStatus status,
                                    bool allow_rerun) -> GalleryQueueItem {
  GalleryQueueItem item;
  {
    std::lock_guard<std::mutex> lock(item_lock_);
    item = LoadItem(path);
    Transition(item, status, allow_rerun);
    Persist(item);
  }
  if (hub_) hub_->PublishStatus(path, item.status_);
  return item;
}

/**
 * @brief Record upload progress. uploaded_images never exceeds total_images.
 *
 * @param path
 * @param uploaded_images
 * @param total_images 0 keeps the stored total
 */
void QueueManager::UpdateProgress(const gallery_path_t& path, uint32_t uploaded_images,
                                  uint32_t total_images) {
  std::lock_guard<std::mutex> lock(item_lock_);
  auto                        item = LoadItem(path);
  if (total_images > 0) {
    item.total_images_ = total_images;
  }
  item.uploaded_images_ = std::min(uploaded_images, item.total_images_);
  Persist(item);
}

auto QueueManager::FinishUpload(const gallery_path_t& path, GalleryStatus status,
                                const UploadRecord& record) -> GalleryQueueItem {
  GalleryQueueItem item;
  {
    std::lock_guard<std::mutex> lock(item_lock_);
    item = LoadItem(path);
    Transition(item, status);

    if (record.total_images_ > 0) {
      item.total_images_ = record.total_images_;
    }
    if (!record.gallery_id_.empty()) {
      item.gallery_id_ = record.gallery_id_;
    }
    if (!record.gallery_url_.empty()) {
      item.gallery_url_ = record.gallery_url_;
    }
    item.uploaded_bytes_ += record.uploaded_bytes_;
    item.error_message_ = record.error_message_;
    item.failed_files_  = record.failed_files_;

    if (status == GalleryStatus::COMPLETED) {
      // Nothing left to resume
      item.uploaded_images_ = std::max<uint32_t>(
          item.total_images_, static_cast<uint32_t>(record.uploaded_files_.size()));
      item.total_images_    = item.uploaded_images_;
      item.uploaded_files_.clear();
    } else {
      item.uploaded_files_  = record.uploaded_files_;
      item.total_images_    = std::max<uint32_t>(
          item.total_images_, static_cast<uint32_t>(item.uploaded_files_.size()));
      item.uploaded_images_ = static_cast<uint32_t>(item.uploaded_files_.size());
    }
    Persist(item);
  }
  if (hub_) hub_->PublishStatus(path, item.status_);
  return item;
}

auto QueueManager::MarkCompleted(const gallery_path_t& path, const UploadRecord& record)
    -> GalleryQueueItem {
  return FinishUpload(path, GalleryStatus::COMPLETED, record);
}

auto QueueManager::MarkIncomplete(const gallery_path_t& path, const UploadRecord& record)
    -> GalleryQueueItem {
  return FinishUpload(path, GalleryStatus::INCOMPLETE, record);
}

auto QueueManager::MarkPaused(const gallery_path_t& path, const UploadRecord& record)
    -> GalleryQueueItem {
  return FinishUpload(path, GalleryStatus::PAUSED, record);
}

auto QueueManager::MarkFailed(const gallery_path_t& path, const UploadRecord& record)
    -> GalleryQueueItem {
  Logger::Get("queue")->error("Upload of {} failed: {}", path.string(), record.error_message_);
  if (hub_ && !record.error_message_.empty()) hub_->PublishLog(path, record.error_message_);
  return FinishUpload(path, GalleryStatus::FAILED, record);
}

auto QueueManager::MarkUploadFailed(const gallery_path_t& path, const std::string& message,
                                    const std::vector<FailedFile>& failed_files)
    -> GalleryQueueItem {
  GalleryQueueItem item;
  {
    std::lock_guard<std::mutex> lock(item_lock_);
    item = LoadItem(path);
    Transition(item, GalleryStatus::FAILED);
    item.error_message_ = message;
    item.failed_files_  = failed_files;
    Persist(item);
  }
  Logger::Get("queue")->error("Upload of {} failed: {}", path.string(), message);
  if (hub_) {
    hub_->PublishLog(path, message);
    hub_->PublishStatus(path, item.status_);
  }
  return item;
}

auto QueueManager::RemoveItem(const gallery_path_t& path) -> bool {
  // Held across the delete so a worker cannot claim the item halfway
  std::lock_guard<std::mutex> claim_lock(claim_lock_);
  if (claimed_.contains(path)) {
    Logger::Get("queue")->warn("Refusing to remove {} while it is being uploaded",
                               path.string());
    return false;
  }
  std::lock_guard<std::mutex> lock(item_lock_);
  return store_->RemoveItem(path);
}

auto QueueManager::GetItem(const gallery_path_t& path) const -> std::optional<GalleryQueueItem> {
  return store_->GetItem(path);
}

auto QueueManager::GetAllItems() const -> std::vector<GalleryQueueItem> {
  return store_->GetAllItems();
}

auto QueueManager::GetQueueStats() const -> QueueStats { return store_->GetStats(); }
};  // namespace gallup
