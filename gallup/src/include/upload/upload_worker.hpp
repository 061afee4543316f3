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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

#include "concurrency/concurrency_coordinator.hpp"
#include "concurrency/thread_pool.hpp"
#include "queue/gallery_queue_item.hpp"
#include "queue/queue_manager.hpp"
#include "storage/disk/disk_space_monitor.hpp"
#include "type/type.hpp"
#include "upload/notification_hub.hpp"
#include "upload/uploader.hpp"
#include "utils/bandwidth/bandwidth_tracker.hpp"

namespace gallup {
struct WorkerOptions {
  host_name_t               default_host_ = "imx";
  std::chrono::milliseconds slot_timeout_{5000};
  std::chrono::milliseconds idle_wait_{100};
  std::chrono::milliseconds maintenance_interval_{60000};
};

enum class WorkerStep : uint8_t {
  PROCESSED = 0,  // an item reached a new resting status
  IDLE      = 1,  // nothing queued
  REFUSED   = 2   // work is queued but admission said no; the item stays queued
};

/**
 * @brief One consumer of the upload queue.
 *
 * Takes one item at a time: claims it from the QueueManager, passes the disk and
 * concurrency admission checks, holds a coordinator slot for the whole transfer and writes
 * the resulting status back. More throughput comes from more workers sharing the same
 * coordinator, never from one worker running items in parallel.
 */
class UploadWorker {
 public:
  using CompletionHandler = std::function<void(const GalleryQueueItem&, const UploadResult&)>;
  using MaintenanceTask   = std::function<void()>;

  UploadWorker(std::string name, std::shared_ptr<QueueManager> queue,
               std::shared_ptr<ConcurrencyCoordinator> coordinator,
               std::shared_ptr<DiskSpaceMonitor> disk, std::shared_ptr<Uploader> uploader,
               std::shared_ptr<BandwidthTracker> bandwidth = nullptr,
               std::shared_ptr<NotificationHub>  hub       = nullptr);
  ~UploadWorker();

  UploadWorker(const UploadWorker&)            = delete;
  UploadWorker& operator=(const UploadWorker&) = delete;

  void Start();
  /**
   * @brief Stop the loop and block until it has exited. The item in flight is asked to
   * soft-stop and ends up paused.
   */
  void Stop();
  void Pause();
  void Resume();
  // Cooperative: the uploader notices between two images
  void StopCurrentUpload();

  /**
   * @brief One pass of the loop body: claim, admit, upload, record.
   *
   * @return WorkerStep
   */
  auto ProcessNext() -> WorkerStep;

  auto IsRunning() const -> bool { return running_.load(); }
  auto IsPaused() const -> bool;
  auto GetCurrentItem() const -> std::optional<gallery_path_t>;
  auto GetName() const -> const std::string& { return name_; }

  void SetRunConfig(const UploadConfig& config);
  void SetOptions(const WorkerOptions& options);
  auto GetRunConfig() const -> UploadConfig;
  auto GetOptions() const -> WorkerOptions;

  void SetCompletionHandler(CompletionHandler handler);
  void SetMaintenanceTask(MaintenanceTask task);

 private:
  void Run();
  void WaitIdle(std::chrono::milliseconds wait);
  auto Execute(GalleryQueueItem& item, const host_name_t& host) -> GalleryStatus;
  auto RecoverUnrecordedOutcome(const gallery_path_t& path, const std::string& error)
      -> GalleryStatus;
  auto SoftStopRequested() const -> bool;
  void RunMaintenanceIfDue();
  void PublishStats(bool force);
  void NoteRefusal(const std::string& reason);

  std::string                             name_;
  std::shared_ptr<QueueManager>           queue_;
  std::shared_ptr<ConcurrencyCoordinator> coordinator_;
  std::shared_ptr<DiskSpaceMonitor>       disk_;
  std::shared_ptr<Uploader>               uploader_;
  std::shared_ptr<BandwidthTracker>       bandwidth_;
  std::shared_ptr<NotificationHub>        hub_;

  std::atomic<bool>                       running_{false};
  std::atomic<bool>                       stopping_{false};
  std::atomic<bool>                       stop_current_{false};

  mutable std::mutex                      state_lock_;
  std::condition_variable                 state_cv_;
  bool                                    paused_ = false;
  std::optional<gallery_path_t>           current_item_{};

  mutable std::mutex                      config_lock_;
  UploadConfig                            run_config_{};
  WorkerOptions                           options_{};
  CompletionHandler                       completion_handler_{};
  MaintenanceTask                         maintenance_task_{};

  std::chrono::steady_clock::time_point   last_maintenance_{};
  std::chrono::steady_clock::time_point   last_stats_{};
  std::string                             last_refusal_{};

  std::thread                             thread_;
  // Post-completion work must not hold a coordinator slot
  ThreadPool                              completion_pool_{1};
};
};  // namespace gallup
