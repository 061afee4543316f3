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
#include <map>
#include <mutex>
#include <string>

#include "queue/gallery_queue_item.hpp"
#include "type/type.hpp"

namespace gallup {
enum class PipelineEventType : uint8_t {
  STATUS_CHANGED = 0,
  PROGRESS       = 1,
  LOG            = 2,
  QUEUE_STATS    = 3,
  BANDWIDTH      = 4
};

struct PipelineEvent {
  PipelineEventType type_ = PipelineEventType::LOG;
  gallery_path_t    path_{};

  // STATUS_CHANGED
  GalleryStatus     status_ = GalleryStatus::QUEUED;

  // PROGRESS
  uint32_t          completed_ = 0;
  uint32_t          total_     = 0;
  double            percent_   = 0.0;
  std::string       current_file_{};

  // LOG
  std::string       message_{};

  // QUEUE_STATS
  QueueStats        stats_{};

  // BANDWIDTH, bytes per second
  double            rate_ = 0.0;
};

/**
 * @brief Fan-out of pipeline events to any number of subscribers, including none.
 *
 * Subscribers are invoked on the publishing thread, outside the registry lock, so a
 * subscriber may unsubscribe itself. A throwing subscriber is logged and skipped.
 */
class NotificationHub {
 public:
  using Subscriber     = std::function<void(const PipelineEvent&)>;
  using subscription_t = uint32_t;

  auto Subscribe(Subscriber subscriber) -> subscription_t;
  auto Unsubscribe(subscription_t id) -> bool;
  void Publish(const PipelineEvent& event);
  auto SubscriberCount() const -> size_t;

  void PublishStatus(const gallery_path_t& path, GalleryStatus status);
  void PublishLog(const gallery_path_t& path, std::string message);

 private:
  mutable std::mutex                     lock_;
  std::map<subscription_t, Subscriber>   subscribers_;
  subscription_t                         next_id_ = 0;
};
};  // namespace gallup
