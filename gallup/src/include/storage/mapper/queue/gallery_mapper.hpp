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

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"

namespace gallup {
// CREATE TABLE GalleryQueue (path TEXT PRIMARY KEY, item_id UINTEGER, name TEXT, status
// UINTEGER, total_images UINTEGER, uploaded_images UINTEGER, host TEXT, template_name TEXT,
// cover_path TEXT, gallery_id TEXT, gallery_url TEXT, error_message TEXT, uploaded_files JSON,
// failed_files JSON, uploaded_bytes UBIGINT, added_time BIGINT, start_time BIGINT, end_time
// BIGINT);
struct GalleryMapperParams {
  std::unique_ptr<std::string> path;
  uint32_t                     item_id;
  std::unique_ptr<std::string> name;
  uint32_t                     status;
  uint32_t                     total_images;
  uint32_t                     uploaded_images;
  std::unique_ptr<std::string> host;
  std::unique_ptr<std::string> template_name;
  std::unique_ptr<std::string> cover_path;
  std::unique_ptr<std::string> gallery_id;
  std::unique_ptr<std::string> gallery_url;
  std::unique_ptr<std::string> error_message;
  std::unique_ptr<std::string> uploaded_files;
  std::unique_ptr<std::string> failed_files;
  uint64_t                     uploaded_bytes;
  int64_t                      added_time;
  int64_t                      start_time;
  int64_t                      end_time;
};

class GalleryMapper : public MapperInterface<GalleryMapper, GalleryMapperParams, std::string>,
                      public FieldReflectable<GalleryMapper> {
 private:
  static constexpr uint32_t    _field_count      = 18;
  static constexpr const char* _table_name       = "GalleryQueue";
  static constexpr const char* _prime_key_clause = "path=?";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs = {
      FIELD(GalleryMapperParams, path, VARCHAR),
      FIELD(GalleryMapperParams, item_id, UINT32),
      FIELD(GalleryMapperParams, name, VARCHAR),
      FIELD(GalleryMapperParams, status, UINT32),
      FIELD(GalleryMapperParams, total_images, UINT32),
      FIELD(GalleryMapperParams, uploaded_images, UINT32),
      FIELD(GalleryMapperParams, host, VARCHAR),
      FIELD(GalleryMapperParams, template_name, VARCHAR),
      FIELD(GalleryMapperParams, cover_path, VARCHAR),
      FIELD(GalleryMapperParams, gallery_id, VARCHAR),
      FIELD(GalleryMapperParams, gallery_url, VARCHAR),
      FIELD(GalleryMapperParams, error_message, VARCHAR),
      FIELD(GalleryMapperParams, uploaded_files, JSON),
      FIELD(GalleryMapperParams, failed_files, JSON),
      FIELD(GalleryMapperParams, uploaded_bytes, UINT64),
      FIELD(GalleryMapperParams, added_time, INT64),
      FIELD(GalleryMapperParams, start_time, INT64),
      FIELD(GalleryMapperParams, end_time, INT64)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> GalleryMapperParams;
  friend struct FieldReflectable<GalleryMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace gallup
