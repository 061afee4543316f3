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

#include "queue/gallery_scanner.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "type/supported_file_type.hpp"

namespace gallup {
auto GalleryScanner::Scan(const gallery_path_t& folder) const -> ScanResult {
  std::error_code ec;
  if (!std::filesystem::is_directory(folder, ec)) {
    throw std::runtime_error("Gallery folder does not exist: " + folder.string());
  }

  ScanResult result;
  for (std::filesystem::directory_iterator it(folder, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto& path = it->path();
    if (!is_supported_file(path)) {
      continue;
    }
    std::error_code size_ec;
    auto            size = std::filesystem::file_size(path, size_ec);
    if (!size_ec) {
      result.total_bytes_ += size;
    }
    result.images_.push_back(path);
  }
  if (ec) {
    throw std::runtime_error("Cannot list gallery folder " + folder.string() + ": " +
                             ec.message());
  }

  std::sort(result.images_.begin(), result.images_.end(),
            [](const auto& a, const auto& b) { return a.filename() < b.filename(); });
  result.image_count_ = static_cast<uint32_t>(result.images_.size());
  return result;
}
};  // namespace gallup
