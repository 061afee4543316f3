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

#include "storage/mapper/queue/gallery_mapper.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <variant>

namespace gallup {
namespace {
auto TakeString(duckorm::VarTypes& value) -> std::unique_ptr<std::string> {
  auto str = std::get_if<std::unique_ptr<std::string>>(&value);
  if (str == nullptr) {
    throw std::runtime_error("Encounting unmatching types when parsing the data from the DB");
  }
  return std::move(*str);
}

template <typename T>
auto TakeValue(duckorm::VarTypes& value) -> T {
  auto v = std::get_if<T>(&value);
  if (v == nullptr) {
    throw std::runtime_error("Encounting unmatching types when parsing the data from the DB");
  }
  return *v;
}
};  // namespace

auto GalleryMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> GalleryMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for GalleryQueue");
  }
  return {TakeString(data[0]),          TakeValue<uint32_t>(data[1]), TakeString(data[2]),
          TakeValue<uint32_t>(data[3]), TakeValue<uint32_t>(data[4]), TakeValue<uint32_t>(data[5]),
          TakeString(data[6]),          TakeString(data[7]),          TakeString(data[8]),
          TakeString(data[9]),          TakeString(data[10]),         TakeString(data[11]),
          TakeString(data[12]),         TakeString(data[13]),         TakeValue<uint64_t>(data[14]),
          TakeValue<int64_t>(data[15]), TakeValue<int64_t>(data[16]), TakeValue<int64_t>(data[17])};
}
};  // namespace gallup
