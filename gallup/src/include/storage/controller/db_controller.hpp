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

#include <filesystem>
#include <string>

#include "controller_types.hpp"

namespace gallup {
class DBController {
 private:
  duckdb_database              _db = nullptr;

  std::filesystem::path        _db_path;

  constexpr static const char* init_table_query =
      "CREATE TABLE IF NOT EXISTS GalleryQueue (path TEXT PRIMARY KEY, item_id UINTEGER, name "
      "TEXT, status UINTEGER, total_images UINTEGER, uploaded_images UINTEGER, host TEXT, "
      "template_name TEXT, cover_path TEXT, gallery_id TEXT, gallery_url TEXT, error_message "
      "TEXT, uploaded_files JSON, failed_files JSON, uploaded_bytes UBIGINT, added_time BIGINT, "
      "start_time BIGINT, end_time BIGINT);";

 public:
  /**
   * @brief Open (or create) the queue database. ":memory:" opens a private in-memory database.
   *
   * @param db_path
   */
  explicit DBController(std::filesystem::path db_path);
  ~DBController();

  DBController(const DBController&)            = delete;
  DBController& operator=(const DBController&) = delete;

  void InitializeDB();

  auto GetConnectionGuard() -> ConnectionGuard;
};
};  // namespace gallup
