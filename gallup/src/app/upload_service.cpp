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

#include "app/upload_service.hpp"

#include <format>
#include <stdexcept>
#include <string>
#include <utility>

#include "utils/log/logger.hpp"

namespace gallup {
UploadService::UploadService(std::shared_ptr<ConfigService> config,
                             std::shared_ptr<QueueStore> store, std::shared_ptr<Uploader> uploader,
                             std::filesystem::path data_dir, std::filesystem::path temp_dir,
                             DiskSpaceMonitor::SpaceQuery space_query)
    : config_(std::move(config)), uploader_(std::move(uploader)) {
  if (!config_ || !store || !uploader_) {
    throw std::invalid_argument("UploadService needs a config, a queue store and an uploader");
  }
  const auto snapshot = config_->Snapshot();
  Logger::SetLevel(snapshot.log_level_);

  hub_         = std::make_shared<NotificationHub>();
  queue_       = std::make_shared<QueueManager>(std::move(store), hub_);
  coordinator_ = std::make_shared<ConcurrencyCoordinator>(snapshot.global_concurrency_limit_,
                                                          snapshot.per_host_concurrency_limit_);
  disk_        = std::make_shared<DiskSpaceMonitor>(std::move(data_dir), std::move(temp_dir),
                                             snapshot.ToThresholds(), std::move(space_query));
  bandwidth_   = std::make_shared<BandwidthTracker>();

  disk_->OnTierChanged([hub = hub_](DiskTier old_tier, DiskTier new_tier) {
    hub->PublishLog({}, std::format("Disk space tier {} -> {}", DiskTierToString(old_tier),
                                    DiskTierToString(new_tier)));
  });

  config_subscription_ = config_->Subscribe(
      [this](const AppConfig& old_config, const AppConfig& new_config) {
        ApplyConfig(old_config, new_config);
      });
}

UploadService::~UploadService() {
  config_->Unsubscribe(config_subscription_);
  Stop();
}

void UploadService::ConfigureWorker(UploadWorker& worker, const AppConfig& config) {
  WorkerOptions options;
  options.default_host_         = config.default_host_;
  options.slot_timeout_         = std::chrono::milliseconds(config.slot_timeout_ms_);
  options.idle_wait_            = std::chrono::milliseconds(config.idle_wait_ms_);
  options.maintenance_interval_ = std::chrono::milliseconds(config.maintenance_interval_ms_);
  worker.SetOptions(options);
  worker.SetRunConfig(config.ToUploadConfig());
}

void UploadService::Start() {
  std::lock_guard<std::mutex> lock(workers_lock_);
  if (running_) {
    return;
  }
  const auto config = config_->Snapshot();
  disk_->Start();

  workers_.clear();
  for (uint32_t i = 0; i < config.worker_count_; ++i) {
    auto worker = std::make_unique<UploadWorker>(std::format("worker-{}", i + 1), queue_,
                                                 coordinator_, disk_, uploader_, bandwidth_, hub_);
    ConfigureWorker(*worker, config);
    worker->SetCompletionHandler(completion_handler_);
    worker->SetMaintenanceTask(maintenance_task_);
    workers_.push_back(std::move(worker));
  }
  for (auto& worker : workers_) {
    worker->Start();
  }
  running_ = true;
  Logger::Get("uploads")->info("Upload pipeline started with {} worker(s)", workers_.size());
}

void UploadService::Stop() {
  std::lock_guard<std::mutex> lock(workers_lock_);
  if (!running_) {
    return;
  }
  // Ask everyone to wind down first, so workers stop in parallel
  for (auto& worker : workers_) {
    worker->StopCurrentUpload();
  }
  for (auto& worker : workers_) {
    worker->Stop();
  }
  workers_.clear();
  disk_->Stop();
  running_ = false;
  Logger::Get("uploads")->info("Upload pipeline stopped");
}

void UploadService::PauseAll() {
  std::lock_guard<std::mutex> lock(workers_lock_);
  for (auto& worker : workers_) {
    worker->Pause();
  }
}

void UploadService::ResumeAll() {
  std::lock_guard<std::mutex> lock(workers_lock_);
  for (auto& worker : workers_) {
    worker->Resume();
  }
}

void UploadService::StopCurrentUploads() {
  std::lock_guard<std::mutex> lock(workers_lock_);
  for (auto& worker : workers_) {
    worker->StopCurrentUpload();
  }
}

auto UploadService::IsRunning() const -> bool {
  std::lock_guard<std::mutex> lock(workers_lock_);
  return running_;
}

auto UploadService::GetWorkerCount() const -> size_t {
  std::lock_guard<std::mutex> lock(workers_lock_);
  return workers_.size();
}

void UploadService::SetCompletionHandler(UploadWorker::CompletionHandler handler) {
  std::lock_guard<std::mutex> lock(workers_lock_);
  completion_handler_ = std::move(handler);
  for (auto& worker : workers_) {
    worker->SetCompletionHandler(completion_handler_);
  }
}

void UploadService::SetMaintenanceTask(UploadWorker::MaintenanceTask task) {
  std::lock_guard<std::mutex> lock(workers_lock_);
  maintenance_task_ = std::move(task);
  for (auto& worker : workers_) {
    worker->SetMaintenanceTask(maintenance_task_);
  }
}

void UploadService::ApplyConfig(const AppConfig& old_config, const AppConfig& new_config) {
  if (old_config.log_level_ != new_config.log_level_) {
    Logger::SetLevel(new_config.log_level_);
  }
  if (old_config.global_concurrency_limit_ != new_config.global_concurrency_limit_ ||
      old_config.per_host_concurrency_limit_ != new_config.per_host_concurrency_limit_) {
    coordinator_->UpdateLimits(new_config.global_concurrency_limit_,
                               new_config.per_host_concurrency_limit_);
  }
  if (old_config.disk_warning_mb_ != new_config.disk_warning_mb_ ||
      old_config.disk_critical_mb_ != new_config.disk_critical_mb_ ||
      old_config.disk_emergency_mb_ != new_config.disk_emergency_mb_) {
    disk_->UpdateThresholds(new_config.ToThresholds());
  }

  std::lock_guard<std::mutex> lock(workers_lock_);
  for (auto& worker : workers_) {
    ConfigureWorker(*worker, new_config);
  }
  if (running_ && new_config.worker_count_ != workers_.size()) {
    Logger::Get("config")->info("worker_count {} takes effect on the next start",
                                new_config.worker_count_);
  }
}
};  // namespace gallup
