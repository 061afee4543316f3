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

#include "upload/notification_hub.hpp"

#include <exception>
#include <utility>
#include <vector>

#include "utils/log/logger.hpp"

namespace gallup {
auto NotificationHub::Subscribe(Subscriber subscriber) -> subscription_t {
  std::lock_guard<std::mutex> lock(lock_);
  auto                        id = ++next_id_;
  subscribers_.emplace(id, std::move(subscriber));
  return id;
}

auto NotificationHub::Unsubscribe(subscription_t id) -> bool {
  std::lock_guard<std::mutex> lock(lock_);
  return subscribers_.erase(id) > 0;
}

auto NotificationHub::SubscriberCount() const -> size_t {
  std::lock_guard<std::mutex> lock(lock_);
  return subscribers_.size();
}

void NotificationHub::Publish(const PipelineEvent& event) {
  std::vector<Subscriber> snapshot;
  {
    std::lock_guard<std::mutex> lock(lock_);
    snapshot.reserve(subscribers_.size());
    for (const auto& [id, subscriber] : subscribers_) {
      snapshot.push_back(subscriber);
    }
  }
  for (auto& subscriber : snapshot) {
    try {
      subscriber(event);
    } catch (const std::exception& e) {
      Logger::Get("uploads")->warn("Notification subscriber threw for {}: {}",
                                   event.path_.string(), e.what());
    }
  }
}

void NotificationHub::PublishStatus(const gallery_path_t& path, GalleryStatus status) {
  PipelineEvent event;
  event.type_   = PipelineEventType::STATUS_CHANGED;
  event.path_   = path;
  event.status_ = status;
  Publish(event);
}

void NotificationHub::PublishLog(const gallery_path_t& path, std::string message) {
  PipelineEvent event;
  event.type_    = PipelineEventType::LOG;
  event.path_    = path;
  event.message_ = std::move(message);
  Publish(event);
}
};  // namespace gallup
