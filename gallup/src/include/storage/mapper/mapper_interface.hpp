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

#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace gallup {
template <typename Derived, typename Mappable, typename ID>
class MapperInterface {
 public:
  duckdb_connection& _conn;

  MapperInterface(duckdb_connection& conn) : _conn(conn) {}

  /**
   * @brief Insert a new record into the table
   *
   * @param obj
   */
  void Insert(const Mappable&& obj) {
    duckorm::insert(_conn, Derived::TableName(), &obj, Derived::FieldDesc(), Derived::FieldCount());
  }

  /**
   * @brief Insert a record, replacing the one with the same primary key
   *
   * @param obj
   */
  void Upsert(const Mappable&& obj) {
    duckorm::upsert(_conn, Derived::TableName(), &obj, Derived::FieldDesc(), Derived::FieldCount());
  }

  /**
   * @brief Remove a record from the table by its primary key
   *
   * @param remove_id
   */
  void Remove(const ID& remove_id) {
    const std::string key[] = {KeyToString(remove_id)};
    duckorm::remove(_conn, Derived::TableName(), Derived::PrimeKeyClause(), key);
  }

  void RemoveByClause(const std::string& predicate, duckorm::WhereParams params = {}) {
    duckorm::remove(_conn, Derived::TableName(), predicate.c_str(), params);
  }

  /**
   * @brief Get records from the table by a SQL predicate
   *
   * @param where_clause predicate with '?' placeholders
   * @param params values bound to the placeholders
   * @param suffix ORDER BY / LIMIT tail
   * @return std::vector<Mappable>
   */
  auto Get(const char* where_clause, duckorm::WhereParams params = {}, const char* suffix = "")
      -> std::vector<Mappable> {
    auto raw = duckorm::select(_conn, Derived::TableName(), Derived::FieldDesc(),
                               Derived::FieldCount(), where_clause, params, suffix);
    std::vector<Mappable> result;
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  /**
   * @brief Update a record in the table by its primary key
   *
   * @param target_id
   * @param updated
   */
  void Update(const ID& target_id, const Mappable&& updated) {
    const std::string key[] = {KeyToString(target_id)};
    duckorm::update(_conn, Derived::TableName(), &updated, Derived::FieldDesc(),
                    Derived::FieldCount(), Derived::PrimeKeyClause(), key);
  }

 private:
  static auto KeyToString(const ID& id) -> std::string {
    if constexpr (std::is_convertible_v<ID, std::string>) {
      return std::string(id);
    } else {
      return std::to_string(id);
    }
  }
};

template <typename Derived>
struct FieldReflectable {
 public:
  using FieldArrayType = std::span<const duckorm::DuckFieldDesc>;
  static constexpr FieldArrayType FieldDesc() { return Derived::_field_descs; }
  static constexpr uint32_t       FieldCount() { return Derived::_field_count; }
  static constexpr const char*    TableName() { return Derived::_table_name; }
  static constexpr const char*    PrimeKeyClause() { return Derived::_prime_key_clause; }
};
};  // namespace gallup
