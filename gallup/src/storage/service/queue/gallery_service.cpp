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

#include "storage/service/queue/gallery_service.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace gallup {
namespace {
auto Str(const std::string& value) -> std::unique_ptr<std::string> {
  return std::make_unique<std::string>(value);
}

auto ParseJson(const std::unique_ptr<std::string>& raw, nlohmann::json fallback)
    -> nlohmann::json {
  if (!raw || raw->empty()) {
    return fallback;
  }
  return nlohmann::json::parse(*raw);
}
};  // namespace

auto GalleryService::ToParams(const GalleryQueueItem& source) -> GalleryMapperParams {
  nlohmann::json uploaded = nlohmann::json::array();
  for (const auto& name : source.uploaded_files_) {
    uploaded.push_back(name);
  }
  nlohmann::json failed = nlohmann::json::array();
  for (const auto& file : source.failed_files_) {
    failed.push_back({{"file_name", file.file_name_}, {"reason", file.reason_}});
  }

  return {Str(source.path_.string()),
          source.item_id_,
          Str(source.name_),
          static_cast<uint32_t>(source.status_),
          source.total_images_,
          source.uploaded_images_,
          Str(source.host_),
          Str(source.template_name_),
          Str(source.cover_path_),
          Str(source.gallery_id_),
          Str(source.gallery_url_),
          Str(source.error_message_),
          Str(uploaded.dump()),
          Str(failed.dump()),
          source.uploaded_bytes_,
          source.added_time_,
          source.start_time_,
          source.end_time_};
}

auto GalleryService::FromParams(GalleryMapperParams&& param) -> GalleryQueueItem {
  if (param.status > static_cast<uint32_t>(GalleryStatus::FAILED)) {
    throw std::runtime_error("Invalid gallery status stored for " + *param.path);
  }
  GalleryQueueItem item;
  item.item_id_         = param.item_id;
  item.path_            = gallery_path_t(*param.path);
  item.name_            = std::move(*param.name);
  item.status_          = static_cast<GalleryStatus>(param.status);
  item.total_images_    = param.total_images;
  item.uploaded_images_ = param.uploaded_images;
  item.host_            = std::move(*param.host);
  item.template_name_   = std::move(*param.template_name);
  item.cover_path_      = std::move(*param.cover_path);
  item.gallery_id_      = std::move(*param.gallery_id);
  item.gallery_url_     = std::move(*param.gallery_url);
  item.error_message_   = std::move(*param.error_message);
  item.uploaded_bytes_  = param.uploaded_bytes;
  item.added_time_      = param.added_time;
  item.start_time_      = param.start_time;
  item.end_time_        = param.end_time;

  for (const auto& name : ParseJson(param.uploaded_files, nlohmann::json::array())) {
    item.uploaded_files_.insert(name.get<std::string>());
  }
  for (const auto& file : ParseJson(param.failed_files, nlohmann::json::array())) {
    item.failed_files_.push_back(
        {file.at("file_name").get<std::string>(), file.value("reason", std::string{})});
  }
  return item;
}
};  // namespace gallup
