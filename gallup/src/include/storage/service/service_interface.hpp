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

#include <cstddef>
#include <string>
#include <vector>

#include "storage/mapper/mapper_interface.hpp"

namespace gallup {
template <typename Derived, typename InternalType, typename Mappable, typename Mapper, typename ID>
class ServiceInterface {
 private:
  duckdb_connection& _conn;
  Mapper             _mapper;

 public:
  ServiceInterface(duckdb_connection& conn) : _conn(conn), _mapper(conn) {}
  void Insert(const InternalType& obj) { _mapper.Insert(Derived::ToParams(obj)); }
  void Upsert(const InternalType& obj) { _mapper.Upsert(Derived::ToParams(obj)); }

  /**
   * @brief Get the objects by a SQL predicate (WHERE clause)
   *
   * @param predicate
   * @param params values bound to the '?' placeholders of the predicate
   * @param suffix ORDER BY / LIMIT tail
   * @return std::vector<InternalType>
   */
  auto GetByPredicate(const std::string& predicate, duckorm::WhereParams params = {},
                      const char* suffix = "") -> std::vector<InternalType> {
    std::vector<Mappable>     param_results = _mapper.Get(predicate.c_str(), params, suffix);
    std::vector<InternalType> results;
    results.reserve(param_results.size());
    for (auto& param : param_results) {
      results.push_back(Derived::FromParams(std::move(param)));
    }
    return results;
  }

  void RemoveById(const ID& remove_id) { _mapper.Remove(remove_id); }
  void RemoveByClause(const std::string& clause, duckorm::WhereParams params = {}) {
    _mapper.RemoveByClause(clause, params);
  }
  void Update(const InternalType& obj, const ID& update_id) {
    _mapper.Update(update_id, Derived::ToParams(obj));
  }
};
}  // namespace gallup
