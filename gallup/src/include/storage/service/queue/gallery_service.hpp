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

#include <duckdb.h>

#include <string>

#include "queue/gallery_queue_item.hpp"
#include "storage/mapper/queue/gallery_mapper.hpp"
#include "storage/service/service_interface.hpp"

namespace gallup {
class GalleryService
    : public ServiceInterface<GalleryService, GalleryQueueItem, GalleryMapperParams,
                              GalleryMapper, std::string> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const GalleryQueueItem& source) -> GalleryMapperParams;
  static auto FromParams(GalleryMapperParams&& param) -> GalleryQueueItem;
};
};  // namespace gallup
