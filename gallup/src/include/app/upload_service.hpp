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

#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

#include "app/config_service.hpp"
#include "concurrency/concurrency_coordinator.hpp"
#include "queue/queue_manager.hpp"
#include "storage/disk/disk_space_monitor.hpp"
#include "storage/queue_store.hpp"
#include "upload/notification_hub.hpp"
#include "upload/upload_worker.hpp"
#include "upload/uploader.hpp"
#include "utils/bandwidth/bandwidth_tracker.hpp"

namespace gallup {
/**
 * @brief Wires the upload pipeline together: one queue, one coordinator, one disk monitor and
 * worker_count workers sharing them.
 *
 * Configuration changes are applied live: limits, thresholds and the run configuration take
 * effect for the next item; worker_count takes effect on the next Start().
 */
class UploadService {
 public:
  UploadService(std::shared_ptr<ConfigService> config, std::shared_ptr<QueueStore> store,
                std::shared_ptr<Uploader> uploader, std::filesystem::path data_dir,
                std::filesystem::path temp_dir, DiskSpaceMonitor::SpaceQuery space_query = nullptr);
  ~UploadService();

  UploadService(const UploadService&)            = delete;
  UploadService& operator=(const UploadService&) = delete;

  void Start();
  void Stop();
  void PauseAll();
  void ResumeAll();
  void StopCurrentUploads();
  auto IsRunning() const -> bool;
  auto GetWorkerCount() const -> size_t;

  void SetCompletionHandler(UploadWorker::CompletionHandler handler);
  void SetMaintenanceTask(UploadWorker::MaintenanceTask task);

  auto GetQueue() -> std::shared_ptr<QueueManager> { return queue_; }
  auto GetCoordinator() -> std::shared_ptr<ConcurrencyCoordinator> { return coordinator_; }
  auto GetDiskMonitor() -> std::shared_ptr<DiskSpaceMonitor> { return disk_; }
  auto GetBandwidth() -> std::shared_ptr<BandwidthTracker> { return bandwidth_; }
  auto GetNotificationHub() -> std::shared_ptr<NotificationHub> { return hub_; }

 private:
  void ApplyConfig(const AppConfig& old_config, const AppConfig& new_config);
  void ConfigureWorker(UploadWorker& worker, const AppConfig& config);

  std::shared_ptr<ConfigService>             config_;
  std::shared_ptr<NotificationHub>           hub_;
  std::shared_ptr<QueueManager>              queue_;
  std::shared_ptr<ConcurrencyCoordinator>    coordinator_;
  std::shared_ptr<DiskSpaceMonitor>          disk_;
  std::shared_ptr<BandwidthTracker>          bandwidth_;
  std::shared_ptr<Uploader>                  uploader_;

  mutable std::mutex                         workers_lock_;
  std::vector<std::unique_ptr<UploadWorker>> workers_;
  UploadWorker::CompletionHandler            completion_handler_{};
  UploadWorker::MaintenanceTask              maintenance_task_{};
  bool                                       running_ = false;

  ConfigService::subscription_t              config_subscription_ = 0;
};
};  // namespace gallup
