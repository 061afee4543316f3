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
#include <functional>
#include <set>
#include <string>
#include <vector>

#include "queue/gallery_queue_item.hpp"
#include "type/type.hpp"

namespace gallup {
/**
 * @brief Per-run settings handed to the uploader. Snapshotted when an item starts, so a
 * config change only affects items started afterwards.
 */
struct UploadConfig {
  uint32_t    thumbnail_size_      = 3;
  uint32_t    thumbnail_format_    = 2;
  uint32_t    max_retries_         = 3;
  bool        public_gallery_      = true;
  uint32_t    parallel_batch_size_ = 4;
  std::string template_name_{};
};

struct UploadedImage {
  std::string  file_name_{};
  std::string  image_url_{};
  std::string  thumbnail_url_{};
  byte_count_t size_bytes_ = 0;
  uint32_t     width_      = 0;
  uint32_t     height_     = 0;
};

struct DimensionStats {
  uint32_t min_width_  = 0;
  uint32_t max_width_  = 0;
  uint32_t min_height_ = 0;
  uint32_t max_height_ = 0;
  double   avg_width_  = 0.0;
  double   avg_height_ = 0.0;
};

struct UploadResult {
  uint32_t                   successful_count_ = 0;
  uint32_t                   failed_count_     = 0;
  std::vector<FailedFile>    failed_details_{};

  gallery_id_t               gallery_id_{};
  std::string                gallery_name_{};
  std::string                gallery_url_{};

  std::vector<UploadedImage> images_{};
  byte_count_t               total_size_ = 0;
  DimensionStats             dimensions_{};
};

struct UploadRequest {
  gallery_path_t        folder_path_{};
  std::string           gallery_name_{};
  host_name_t           host_{};
  UploadConfig          config_{};
  // Files already on the host from a previous run; the uploader skips them
  std::set<std::string> already_uploaded_{};
};

struct UploadCallbacks {
  using ProgressCallback =
      std::function<void(uint32_t completed, uint32_t total, double percent,
                         const std::string& current_file)>;
  using LogCallback          = std::function<void(const std::string& message)>;
  using SoftStopCheck        = std::function<bool()>;
  using ItemUploadedCallback = std::function<void(const std::string& file_name, byte_count_t size)>;

  ProgressCallback     on_progress_{};
  LogCallback          on_log_{};
  // Polled between units of work; never interrupts a transfer in flight
  SoftStopCheck        should_soft_stop_{};
  ItemUploadedCallback on_item_uploaded_{};
};

/**
 * @brief The transfer itself. Implementations talk to one hosting service; the pipeline
 * only sees this interface.
 *
 * Upload() may invoke the callbacks from several threads. Per-image failures are reported
 * in the result; an exception means the gallery as a whole could not be uploaded.
 */
class Uploader {
 public:
  virtual ~Uploader() = default;

  virtual auto Upload(const UploadRequest& request, const UploadCallbacks& callbacks)
      -> UploadResult = 0;
};
};  // namespace gallup
