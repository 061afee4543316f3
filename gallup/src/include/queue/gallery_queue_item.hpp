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

#include <cstdint>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace gallup {
enum class GalleryStatus : uint8_t {
  QUEUED     = 0,
  SCANNING   = 1,
  READY      = 2,
  UPLOADING  = 3,
  PAUSED     = 4,
  INCOMPLETE = 5,
  COMPLETED  = 6,
  FAILED     = 7
};

auto GalleryStatusToString(GalleryStatus status) -> const char*;
// Throws std::invalid_argument for unknown names
auto GalleryStatusFromString(const std::string& name) -> GalleryStatus;

/**
 * @brief Whether a queue item may move from one status to another.
 *
 * queued -> scanning -> ready -> uploading -> {completed | incomplete | failed | paused};
 * incomplete, failed and paused may re-enter queued or uploading. completed only leaves
 * through an explicit re-run, which callers request with allow_rerun.
 */
auto IsValidTransition(GalleryStatus from, GalleryStatus to, bool allow_rerun = false) -> bool;

class InvalidTransitionError : public std::logic_error {
 public:
  InvalidTransitionError(GalleryStatus from, GalleryStatus to);
};

struct FailedFile {
  std::string file_name_;
  std::string reason_;
};

struct GalleryQueueItem {
  queue_item_id_t         item_id_ = 0;  // 0 until the store assigns one
  gallery_path_t          path_{};
  std::string             name_{};
  GalleryStatus           status_          = GalleryStatus::QUEUED;
  uint32_t                total_images_    = 0;
  uint32_t                uploaded_images_ = 0;

  host_name_t             host_{};
  std::string             template_name_{};
  std::string             cover_path_{};

  gallery_id_t            gallery_id_{};
  std::string             gallery_url_{};
  std::string             error_message_{};

  // Resume set: names already on the host, skipped by the next run
  std::set<std::string>   uploaded_files_{};
  std::vector<FailedFile> failed_files_{};
  byte_count_t            uploaded_bytes_ = 0;

  timestamp_t             added_time_     = 0;
  timestamp_t             start_time_     = 0;
  timestamp_t             end_time_       = 0;
};

struct QueueStats {
  std::map<GalleryStatus, size_t> by_status_{};
  size_t                          total_items_     = 0;
  uint64_t                        total_images_    = 0;
  uint64_t                        uploaded_images_ = 0;

  auto Count(GalleryStatus status) const -> size_t {
    auto it = by_status_.find(status);
    return it == by_status_.end() ? 0 : it->second;
  }
};
};  // namespace gallup
