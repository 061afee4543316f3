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
#include <vector>

#include "type/type.hpp"

namespace gallup {
struct ScanResult {
  uint32_t                           image_count_ = 0;
  byte_count_t                       total_bytes_ = 0;
  // Sorted by file name; the first entry doubles as the cover
  std::vector<std::filesystem::path> images_{};
};

class GalleryScanner {
 public:
  /**
   * @brief Collect the supported images directly inside a gallery folder.
   *
   * @param folder
   * @return ScanResult
   * @throw std::runtime_error when the folder does not exist or cannot be listed
   */
  auto Scan(const gallery_path_t& folder) const -> ScanResult;
};
};  // namespace gallup
