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

#include "storage/controller/queue/queue_controller.hpp"

#include <array>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "utils/log/logger.hpp"

namespace gallup {
namespace {
struct StatusCountRow {
  uint32_t status;
  uint32_t item_count;
  uint64_t total_images;
  uint64_t uploaded_images;
};

constexpr std::array<duckorm::DuckFieldDesc, 4> kStatusCountDescs = {
    FIELD(StatusCountRow, status, UINT32), FIELD(StatusCountRow, item_count, UINT32),
    FIELD(StatusCountRow, total_images, UINT64), FIELD(StatusCountRow, uploaded_images, UINT64)};

struct MaxIdRow {
  uint32_t max_id;
};

constexpr std::array<duckorm::DuckFieldDesc, 1> kMaxIdDescs = {FIELD(MaxIdRow, max_id, UINT32)};

constexpr const char*                           kOrderByAge = "ORDER BY added_time, item_id";
};  // namespace

/**
 * @brief Construct a new Queue Controller:: Queue Controller object
 *
 * @param guard
 */
QueueController::QueueController(ConnectionGuard&& guard)
    : _guard(std::move(guard)), _service(_guard._conn) {
  LoadLastId();
}

/**
 * @brief Continue id assignment after the largest id already stored.
 *
 */
void QueueController::LoadLastId() {
  std::lock_guard<std::mutex> lock(_conn_lock);
  auto rows = duckorm::select_by_query(
      _guard._conn, kMaxIdDescs, kMaxIdDescs.size(),
      "SELECT COALESCE(MAX(item_id), 0)::UINTEGER FROM GalleryQueue");
  _last_id = rows.empty() ? 0 : std::get<uint32_t>(rows[0][0]);
}

auto QueueController::SelectByPath(const gallery_path_t& path)
    -> std::optional<GalleryQueueItem> {
  const std::string key[] = {path.string()};
  auto              found = _service.GetByPredicate("path=?", key);
  if (found.empty()) {
    return std::nullopt;
  }
  return std::move(found.front());
}

/**
 * @brief Get the oldest queued item that nobody has claimed yet.
 *
 * @param exclude paths already handed out to a worker
 * @return std::optional<GalleryQueueItem>
 */
auto QueueController::GetNextQueued(const std::set<gallery_path_t>& exclude)
    -> std::optional<GalleryQueueItem> {
  std::string predicate = std::format("status={}", static_cast<uint32_t>(GalleryStatus::QUEUED));
  std::vector<std::string> params;
  if (!exclude.empty()) {
    predicate += " AND path NOT IN (";
    for (const auto& path : exclude) {
      predicate += params.empty() ? "?" : ", ?";
      params.push_back(path.string());
    }
    predicate += ")";
  }
  const std::string suffix = std::format("{} LIMIT 1", kOrderByAge);

  std::lock_guard<std::mutex> lock(_conn_lock);
  auto found = _service.GetByPredicate(predicate, params, suffix.c_str());
  if (found.empty()) {
    return std::nullopt;
  }
  return std::move(found.front());
}

auto QueueController::GetItem(const gallery_path_t& path) -> std::optional<GalleryQueueItem> {
  std::lock_guard<std::mutex> lock(_conn_lock);
  return SelectByPath(path);
}

auto QueueController::GetAllItems() -> std::vector<GalleryQueueItem> {
  std::lock_guard<std::mutex> lock(_conn_lock);
  return _service.GetByPredicate("", {}, kOrderByAge);
}

/**
 * @brief Overwrite the status column of one item.
 *
 * @param path
 * @param status
 */
void QueueController::UpdateStatus(const gallery_path_t& path, GalleryStatus status) {
  std::lock_guard<std::mutex> lock(_conn_lock);
  auto                        item = SelectByPath(path);
  if (!item.has_value()) {
    throw std::runtime_error("Queue item not found: " + path.string());
  }
  item->status_ = status;
  _service.Update(*item, path.string());
}

/**
 * @brief Insert or replace items keyed by path, assigning ids to new ones.
 *
 * @param items
 */
void QueueController::UpsertItems(std::span<GalleryQueueItem> items) {
  std::lock_guard<std::mutex> lock(_conn_lock);
  for (auto& item : items) {
    if (item.item_id_ == 0) {
      auto existing  = SelectByPath(item.path_);
      item.item_id_  = existing.has_value() ? existing->item_id_ : ++_last_id;
    }
    _service.Upsert(item);
  }
}

auto QueueController::RemoveItem(const gallery_path_t& path) -> bool {
  std::lock_guard<std::mutex> lock(_conn_lock);
  if (!SelectByPath(path).has_value()) {
    return false;
  }
  _service.RemoveById(path.string());
  Logger::Get("storage")->debug("Removed queue row {}", path.string());
  return true;
}

/**
 * @brief Count items per status and sum their image counters.
 *
 * @return QueueStats
 */
auto QueueController::GetStats() -> QueueStats {
  std::lock_guard<std::mutex> lock(_conn_lock);
  auto                        rows = duckorm::select_by_query(
      _guard._conn, kStatusCountDescs, kStatusCountDescs.size(),
      "SELECT status, COUNT(*)::UINTEGER, COALESCE(SUM(total_images), 0)::UBIGINT, "
                             "COALESCE(SUM(uploaded_images), 0)::UBIGINT FROM GalleryQueue GROUP BY status");

  QueueStats stats;
  for (auto& row : rows) {
    auto status        = static_cast<GalleryStatus>(std::get<uint32_t>(row[0]));
    auto count         = std::get<uint32_t>(row[1]);
    stats.by_status_[status] = count;
    stats.total_items_ += count;
    stats.total_images_ += std::get<uint64_t>(row[2]);
    stats.uploaded_images_ += std::get<uint64_t>(row[3]);
  }
  return stats;
}
};  // namespace gallup
