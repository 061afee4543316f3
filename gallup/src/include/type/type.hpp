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
#include <filesystem>
#include <string>

namespace gallup {

// Absolute gallery folder, primary key of the queue
#define gallery_path_t std::filesystem::path

// Store-assigned id of a queue item, also the key of a concurrency slot
#define queue_item_id_t uint32_t

// Destination host name, e.g. "imx"
#define host_name_t     std::string

// Remote gallery id, assigned by the host after creation
#define gallery_id_t    std::string

// Seconds since epoch
#define timestamp_t     int64_t

#define byte_count_t    uint64_t
};  // namespace gallup
