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

#include "storage/mapper/duckorm/duckdb_orm.hpp"

#include <duckdb.h>

#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace duckorm {
static void BindField(duckdb_prepared_statement stmt, idx_t index, const DuckFieldDesc& field,
                      const void* obj) {
  const char* ptr = reinterpret_cast<const char*>(obj) + field.offset;
  switch (field.type) {
    case DuckDBType::INT32:
      duckdb_bind_int32(stmt, index, *reinterpret_cast<const int32_t*>(ptr));
      break;
    case DuckDBType::INT64:
      duckdb_bind_int64(stmt, index, *reinterpret_cast<const int64_t*>(ptr));
      break;
    case DuckDBType::UINT32:
      duckdb_bind_uint32(stmt, index, *reinterpret_cast<const uint32_t*>(ptr));
      break;
    case DuckDBType::UINT64:
      duckdb_bind_uint64(stmt, index, *reinterpret_cast<const uint64_t*>(ptr));
      break;
    case DuckDBType::DOUBLE:
      duckdb_bind_double(stmt, index, *reinterpret_cast<const double*>(ptr));
      break;
    case DuckDBType::BOOLEAN:
      duckdb_bind_boolean(stmt, index, *reinterpret_cast<const bool*>(ptr));
      break;
    case DuckDBType::JSON:
    case DuckDBType::VARCHAR: {
      // String members are held as std::unique_ptr<std::string>
      auto member_ptr = reinterpret_cast<const std::unique_ptr<std::string>*>(ptr);
      if (*member_ptr) {
        duckdb_bind_varchar(stmt, index, (*member_ptr)->c_str());
      } else {
        duckdb_bind_null(stmt, index);
      }
      break;
    }
    default:
      throw std::runtime_error("Unsupported DuckFieldType in BindField()");
  }
}

static void BindParams(duckdb_prepared_statement stmt, idx_t first_index, WhereParams params) {
  for (size_t i = 0; i < params.size(); ++i) {
    duckdb_bind_varchar(stmt, first_index + i, params[i].c_str());
  }
}

static auto ReadRows(duckdb_result& result, std::span<const DuckFieldDesc> sample_fields,
                     size_t field_count) -> std::vector<std::vector<VarTypes>> {
  if (duckdb_column_count(&result) != field_count) {
    throw std::runtime_error("Column count mismatch in select query");
  }
  std::vector<std::vector<VarTypes>> results;
  idx_t                              row_count = duckdb_row_count(&result);
  results.resize(row_count);
  for (idx_t i = 0; i < row_count; ++i) {
    results[i].reserve(field_count);
    for (size_t j = 0; j < field_count; ++j) {
      switch (sample_fields[j].type) {
        case DuckDBType::INT32:
          results[i].emplace_back(duckdb_value_int32(&result, j, i));
          break;
        case DuckDBType::INT64:
          results[i].emplace_back(duckdb_value_int64(&result, j, i));
          break;
        case DuckDBType::UINT32:
          results[i].emplace_back(duckdb_value_uint32(&result, j, i));
          break;
        case DuckDBType::UINT64:
          results[i].emplace_back(duckdb_value_uint64(&result, j, i));
          break;
        case DuckDBType::DOUBLE:
          results[i].emplace_back(duckdb_value_double(&result, j, i));
          break;
        case DuckDBType::BOOLEAN:
          results[i].emplace_back(duckdb_value_boolean(&result, j, i));
          break;
        case DuckDBType::VARCHAR:
        case DuckDBType::JSON: {
          if (duckdb_value_is_null(&result, j, i)) {
            results[i].emplace_back(std::make_unique<std::string>());
            break;
          }
          char* value = duckdb_value_varchar(&result, j, i);
          results[i].emplace_back(std::make_unique<std::string>(value ? value : ""));
          duckdb_free(value);
          break;
        }
        default:
          throw std::runtime_error("Unsupported DuckFieldType in select()");
      }
    }
  }
  return results;
}

static duckdb_state InsertWithVerb(duckdb_connection& conn, const char* verb, const char* table,
                                   const void* obj, std::span<const DuckFieldDesc> fields,
                                   size_t field_count) {
  std::ostringstream sql;
  sql << verb << " INTO " << table << " (";
  for (size_t i = 0; i < field_count; ++i) {
    sql << fields[i].name;
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << ") VALUES (";
  for (size_t i = 0; i < field_count; ++i) {
    sql << "?";
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << ");";

  PreparedStatement insert_pre(conn, sql.str());
  for (size_t i = 0; i < field_count; ++i) {
    BindField(insert_pre._stmt, i + 1, fields[i], obj);
  }
  insert_pre.Execute();
  return DuckDBSuccess;
}

duckdb_state insert(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields, size_t field_count) {
  return InsertWithVerb(conn, "INSERT", table, obj, fields, field_count);
}

duckdb_state upsert(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields, size_t field_count) {
  return InsertWithVerb(conn, "INSERT OR REPLACE", table, obj, fields, field_count);
}

duckdb_state update(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields, size_t field_count,
                    const char* where_clause, WhereParams params) {
  std::ostringstream sql;
  sql << "UPDATE " << table << " SET ";
  for (size_t i = 0; i < field_count; ++i) {
    sql << fields[i].name << " = ?";
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << " WHERE " << where_clause << ";";

  PreparedStatement update_pre(conn, sql.str());
  for (size_t i = 0; i < field_count; ++i) {
    BindField(update_pre._stmt, i + 1, fields[i], obj);
  }
  BindParams(update_pre._stmt, field_count + 1, params);
  update_pre.Execute();
  return DuckDBSuccess;
}

duckdb_state remove(duckdb_connection& conn, const char* table, const char* where_clause,
                    WhereParams params) {
  std::ostringstream sql;
  sql << "DELETE FROM " << table << " WHERE " << where_clause << ";";

  PreparedStatement delete_pre(conn, sql.str());
  BindParams(delete_pre._stmt, 1, params);
  delete_pre.Execute();
  return DuckDBSuccess;
}

std::vector<std::vector<VarTypes>> select(duckdb_connection& conn, const std::string& table,
                                          std::span<const DuckFieldDesc> sample_fields,
                                          size_t field_count, const char* where_clause,
                                          WhereParams params, const char* suffix) {
  std::ostringstream sql;
  sql << "SELECT * FROM " << table;
  if (where_clause != nullptr && where_clause[0] != '\0') {
    sql << " WHERE " << where_clause;
  }
  sql << " " << suffix << ";";
  return select_by_query(conn, sample_fields, field_count, sql.str(), params);
}

std::vector<std::vector<VarTypes>> select_by_query(duckdb_connection&             conn,
                                                   std::span<const DuckFieldDesc> sample_fields,
                                                   size_t field_count, const std::string& sql,
                                                   WhereParams params) {
  PreparedStatement select_pre(conn, sql);
  BindParams(select_pre._stmt, 1, params);
  select_pre.Execute();
  return ReadRows(select_pre._result, sample_fields, field_count);
}
};  // namespace duckorm
