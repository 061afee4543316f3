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

#include "storage/mapper/duckorm/duckdb_types.hpp"

#include <duckdb.h>

#include <cstring>
#include <stdexcept>

namespace duckorm {
void PreparedStatement::RecycleResources() {
  if (_stmt) {
    duckdb_destroy_prepare(&_stmt);
    _stmt = nullptr;
  }
  if (_executed) {
    duckdb_destroy_result(&_result);
    _executed = false;
  }
}

PreparedStatement::PreparedStatement(duckdb_connection& con) : _stmt(nullptr), _con(con) {
  std::memset(&_result, 0, sizeof(_result));
}

PreparedStatement::PreparedStatement(duckdb_connection& con, const std::string& prepare_query)
    : PreparedStatement(con) {
  GetStmtGuard(prepare_query);
}

PreparedStatement::~PreparedStatement() { RecycleResources(); }

auto PreparedStatement::GetStmtGuard(const std::string& prepare_query)
    -> duckdb_prepared_statement& {
  RecycleResources();
  if (duckdb_prepare(_con, prepare_query.c_str(), &_stmt) != DuckDBSuccess) {
    const char* err = duckdb_prepare_error(_stmt);
    std::string msg = "PreparedStatement failed in GetStmtGuard";
    if (err && std::strlen(err) > 0) {
      msg += ": ";
      msg += err;
    }
    RecycleResources();
    throw std::runtime_error(msg);
  }
  _prepared = true;
  return _stmt;
}

void PreparedStatement::Execute() {
  if (!_prepared) {
    throw std::runtime_error("PreparedStatement executed before being prepared");
  }
  if (_executed) {
    duckdb_destroy_result(&_result);
  }
  auto state = duckdb_execute_prepared(_stmt, &_result);
  _executed  = true;
  if (state != DuckDBSuccess) {
    const char* err = duckdb_result_error(&_result);
    throw std::runtime_error(err ? err : "Unknown DuckDB execution error");
  }
}
};  // namespace duckorm
