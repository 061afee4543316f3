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

#include "storage/controller/db_controller.hpp"

#include <duckdb.h>

#include <stdexcept>
#include <string>

#include "utils/log/logger.hpp"

namespace gallup {
DBController::DBController(std::filesystem::path db_path) : _db_path(std::move(db_path)) {
  InitializeDB();
}

DBController::~DBController() {
  if (_db != nullptr) {
    duckdb_close(&_db);
  }
}

/**
 * @brief Get a connection guard for the database.
 *
 * @return ConnectionGuard
 */
auto DBController::GetConnectionGuard() -> ConnectionGuard {
  ConnectionGuard guard{nullptr};

  if (duckdb_connect(_db, &guard._conn) != DuckDBSuccess) {
    throw std::runtime_error("DB cannot be connected: " + _db_path.string());
  }

  return guard;
}

/**
 * @brief Open the database file and create the queue table when it is missing.
 *
 */
void DBController::InitializeDB() {
  const std::string path_str = _db_path.string();
  if (path_str != ":memory:" && _db_path.has_parent_path()) {
    std::filesystem::create_directories(_db_path.parent_path());
  }
  if (duckdb_open(path_str == ":memory:" ? nullptr : path_str.c_str(), &_db) != DuckDBSuccess) {
    throw std::runtime_error("DB cannot be created: " + path_str);
  }

  auto          guard = GetConnectionGuard();

  duckdb_result result;
  if (duckdb_query(guard._conn, init_table_query, &result) != DuckDBSuccess) {
    std::string error_message = duckdb_result_error(&result);
    duckdb_destroy_result(&result);
    throw std::runtime_error(error_message);
  }
  duckdb_destroy_result(&result);
  Logger::Get("storage")->debug("Queue database ready at {}", path_str);
}
};  // namespace gallup
