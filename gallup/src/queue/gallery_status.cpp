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

#include <format>
#include <stdexcept>

#include "queue/gallery_queue_item.hpp"

namespace gallup {
auto GalleryStatusToString(GalleryStatus status) -> const char* {
  switch (status) {
    case GalleryStatus::QUEUED:
      return "queued";
    case GalleryStatus::SCANNING:
      return "scanning";
    case GalleryStatus::READY:
      return "ready";
    case GalleryStatus::UPLOADING:
      return "uploading";
    case GalleryStatus::PAUSED:
      return "paused";
    case GalleryStatus::INCOMPLETE:
      return "incomplete";
    case GalleryStatus::COMPLETED:
      return "completed";
    case GalleryStatus::FAILED:
      return "failed";
  }
  return "unknown";
}

auto GalleryStatusFromString(const std::string& name) -> GalleryStatus {
  for (uint8_t i = 0; i <= static_cast<uint8_t>(GalleryStatus::FAILED); ++i) {
    auto status = static_cast<GalleryStatus>(i);
    if (name == GalleryStatusToString(status)) {
      return status;
    }
  }
  throw std::invalid_argument("Unknown gallery status: " + name);
}

auto IsValidTransition(GalleryStatus from, GalleryStatus to, bool allow_rerun) -> bool {
  if (from == to) {
    return true;
  }
  switch (from) {
    case GalleryStatus::QUEUED:
      return to == GalleryStatus::SCANNING || to == GalleryStatus::UPLOADING;
    case GalleryStatus::SCANNING:
      // A folder that cannot be scanned fails without ever being uploaded
      return to == GalleryStatus::READY || to == GalleryStatus::FAILED;
    case GalleryStatus::READY:
      return to == GalleryStatus::QUEUED || to == GalleryStatus::UPLOADING;
    case GalleryStatus::UPLOADING:
      return to == GalleryStatus::COMPLETED || to == GalleryStatus::INCOMPLETE ||
             to == GalleryStatus::FAILED || to == GalleryStatus::PAUSED;
    case GalleryStatus::PAUSED:
    case GalleryStatus::INCOMPLETE:
    case GalleryStatus::FAILED:
      return to == GalleryStatus::QUEUED || to == GalleryStatus::UPLOADING;
    case GalleryStatus::COMPLETED:
      return allow_rerun && to == GalleryStatus::QUEUED;
  }
  return false;
}

InvalidTransitionError::InvalidTransitionError(GalleryStatus from, GalleryStatus to)
    : std::logic_error(std::format("Invalid queue transition {} -> {}",
                                   GalleryStatusToString(from), GalleryStatusToString(to))) {}
};  // namespace gallup
