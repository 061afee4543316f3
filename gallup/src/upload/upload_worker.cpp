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

#include "upload/upload_worker.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <stdexcept>
#include <utility>
#include <vector>

#include "utils/log/logger.hpp"

namespace gallup {
namespace {
/**
 * @brief Gives a claimed item back to the queue on every exit path.
 */
class ClaimHold {
 public:
  ClaimHold(QueueManager& queue, gallery_path_t path) : queue_(queue), path_(std::move(path)) {}
  ~ClaimHold() { queue_.ReleaseClaim(path_); }

  ClaimHold(const ClaimHold&)            = delete;
  ClaimHold& operator=(const ClaimHold&) = delete;

 private:
  QueueManager&  queue_;
  gallery_path_t path_;
};

constexpr std::chrono::seconds kStatsInterval{1};
};  // namespace

UploadWorker::UploadWorker(std::string name, std::shared_ptr<QueueManager> queue,
                           std::shared_ptr<ConcurrencyCoordinator> coordinator,
                           std::shared_ptr<DiskSpaceMonitor> disk, std::shared_ptr<Uploader> uploader,
                           std::shared_ptr<BandwidthTracker> bandwidth,
                           std::shared_ptr<NotificationHub>  hub)
    : name_(std::move(name)),
      queue_(std::move(queue)),
      coordinator_(std::move(coordinator)),
      disk_(std::move(disk)),
      uploader_(std::move(uploader)),
      bandwidth_(std::move(bandwidth)),
      hub_(std::move(hub)) {
  if (!queue_ || !coordinator_ || !uploader_) {
    throw std::invalid_argument("UploadWorker needs a queue, a coordinator and an uploader");
  }
}

UploadWorker::~UploadWorker() { Stop(); }

void UploadWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  stopping_ = false;
  thread_   = std::thread(&UploadWorker::Run, this);
  Logger::Get("uploads")->info("Worker {} started", name_);
}

void UploadWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(state_lock_);
    stopping_ = true;
    running_  = false;
  }
  state_cv_.notify_all();
  if (thread_.joinable()) {
    if (thread_.get_id() == std::this_thread::get_id()) {
      // Called from inside a callback; Run() returns on its own
      thread_.detach();
    } else {
      thread_.join();
    }
    Logger::Get("uploads")->info("Worker {} stopped", name_);
  }
}

void UploadWorker::Pause() {
  std::lock_guard<std::mutex> lock(state_lock_);
  paused_ = true;
}

void UploadWorker::Resume() {
  {
    std::lock_guard<std::mutex> lock(state_lock_);
    paused_ = false;
  }
  state_cv_.notify_all();
}

void UploadWorker::StopCurrentUpload() {
  std::lock_guard<std::mutex> lock(state_lock_);
  if (current_item_.has_value()) {
    stop_current_ = true;
    Logger::Get("uploads")->info("Worker {}: stop requested for {}", name_,
                                 current_item_->string());
  }
}

auto UploadWorker::IsPaused() const -> bool {
  std::lock_guard<std::mutex> lock(state_lock_);
  return paused_;
}

auto UploadWorker::GetCurrentItem() const -> std::optional<gallery_path_t> {
  std::lock_guard<std::mutex> lock(state_lock_);
  return current_item_;
}

void UploadWorker::SetRunConfig(const UploadConfig& config) {
  std::lock_guard<std::mutex> lock(config_lock_);
  run_config_ = config;
}

void UploadWorker::SetOptions(const WorkerOptions& options) {
  std::lock_guard<std::mutex> lock(config_lock_);
  options_ = options;
}

auto UploadWorker::GetRunConfig() const -> UploadConfig {
  std::lock_guard<std::mutex> lock(config_lock_);
  return run_config_;
}

auto UploadWorker::GetOptions() const -> WorkerOptions {
  std::lock_guard<std::mutex> lock(config_lock_);
  return options_;
}

void UploadWorker::SetCompletionHandler(CompletionHandler handler) {
  std::lock_guard<std::mutex> lock(config_lock_);
  completion_handler_ = std::move(handler);
}

void UploadWorker::SetMaintenanceTask(MaintenanceTask task) {
  std::lock_guard<std::mutex> lock(config_lock_);
  maintenance_task_ = std::move(task);
}

auto UploadWorker::SoftStopRequested() const -> bool {
  return stop_current_.load() || stopping_.load();
}

void UploadWorker::WaitIdle(std::chrono::milliseconds wait) {
  std::unique_lock<std::mutex> lock(state_lock_);
  state_cv_.wait_for(lock, wait, [this] { return !running_.load(); });
}

void UploadWorker::Run() {
  while (running_) {
    {
      std::unique_lock<std::mutex> lock(state_lock_);
      state_cv_.wait(lock, [this] { return !paused_ || !running_.load(); });
    }
    if (!running_) {
      break;
    }

    WorkerStep step = WorkerStep::IDLE;
    try {
      step = ProcessNext();
    } catch (const std::exception& e) {
      // The loop outlives any single item
      Logger::Get("uploads")->error("Worker {}: {}", name_, e.what());
    }
    if (step != WorkerStep::PROCESSED) {
      WaitIdle(GetOptions().idle_wait_);
    }
  }
}

void UploadWorker::NoteRefusal(const std::string& reason) {
  if (reason == last_refusal_) {
    return;
  }
  last_refusal_ = reason;
  Logger::Get("uploads")->info("Worker {}: {}", name_, reason);
}

auto UploadWorker::ProcessNext() -> WorkerStep {
  if (disk_ && !disk_->CanStartUpload()) {
    NoteRefusal(std::format("disk space tier {} holds back new uploads",
                            DiskTierToString(disk_->GetCurrentTier())));
    return WorkerStep::REFUSED;
  }

  auto claimed = queue_->ClaimNextQueued();
  if (!claimed.has_value()) {
    RunMaintenanceIfDue();
    PublishStats(false);
    return WorkerStep::IDLE;
  }

  GalleryQueueItem item = std::move(*claimed);
  ClaimHold        hold(*queue_, item.path_);
  const auto       options = GetOptions();
  const auto       host    = item.host_.empty() ? options.default_host_ : item.host_;

  if (!coordinator_->CanStartUpload(host)) {
    NoteRefusal(std::format("no upload slot free for host {}", host));
    return WorkerStep::REFUSED;
  }

  std::optional<SlotGuard> slot;
  try {
    slot.emplace(coordinator_->AcquireSlot(item.item_id_, host, options.slot_timeout_));
  } catch (const SlotTimeoutError& e) {
    NoteRefusal(std::format("{} stays queued: {}", item.path_.string(), e.what()));
    return WorkerStep::REFUSED;
  }
  last_refusal_.clear();

  {
    std::lock_guard<std::mutex> lock(state_lock_);
    current_item_ = item.path_;
    stop_current_ = false;
  }

  GalleryStatus final_status = GalleryStatus::UPLOADING;
  try {
    final_status = Execute(item, host);
  } catch (...) {
    std::lock_guard<std::mutex> lock(state_lock_);
    current_item_.reset();
    throw;
  }
  slot.reset();

  {
    std::lock_guard<std::mutex> lock(state_lock_);
    current_item_.reset();
    stop_current_ = false;
  }
  if (final_status != GalleryStatus::UPLOADING) {
    PublishStats(true);
  }
  return WorkerStep::PROCESSED;
}

/**
 * @brief Run the uploader for one admitted item and persist where it ended.
 *
 * Precedence of the outcome: a soft-stop always yields paused, then an exception yields
 * failed, then per-image failures yield incomplete (or failed if nothing at all made it),
 * otherwise completed.
 *
 * @return GalleryStatus the status written back; UPLOADING if the item could not even be
 * moved to uploading
 */
auto UploadWorker::Execute(GalleryQueueItem& item, const host_name_t& host) -> GalleryStatus {
  auto        log  = Logger::Get("uploads");
  const auto& path = item.path_;

  try {
    item = queue_->UpdateItemStatus(path, GalleryStatus::UPLOADING);
  } catch (const std::exception& e) {
    log->error("Worker {}: cannot start {}: {}", name_, path.string(), e.what());
    return GalleryStatus::UPLOADING;
  }

  // Seeded from whatever earlier runs persisted; grows as images land
  std::mutex            resume_lock;
  std::set<std::string> resume_set = item.uploaded_files_;
  std::atomic<uint64_t> run_bytes{0};
  if (!resume_set.empty()) {
    log->info("Resuming {} with {} images already uploaded", path.string(), resume_set.size());
  }

  UploadRequest request;
  request.folder_path_           = path;
  request.gallery_name_          = item.name_;
  request.host_                  = host;
  request.config_                = GetRunConfig();
  if (!item.template_name_.empty()) {
    request.config_.template_name_ = item.template_name_;
  }
  request.already_uploaded_ = resume_set;

  UploadCallbacks callbacks;
  callbacks.on_progress_ = [this, &path, &resume_lock, &resume_set](
                               uint32_t completed, uint32_t total, double percent,
                               const std::string& current_file) {
    size_t done = 0;
    {
      std::lock_guard<std::mutex> lock(resume_lock);
      done = resume_set.size();
    }
    queue_->UpdateProgress(path, static_cast<uint32_t>(done), 0);
    if (hub_) {
      PipelineEvent event;
      event.type_         = PipelineEventType::PROGRESS;
      event.path_         = path;
      event.completed_    = completed;
      event.total_        = total;
      event.percent_      = percent;
      event.current_file_ = current_file;
      hub_->Publish(event);
    }
  };
  callbacks.on_log_ = [this, &path](const std::string& message) {
    Logger::Get("uploads")->info("[{}] {}", path.filename().string(), message);
    if (hub_) hub_->PublishLog(path, message);
  };
  callbacks.should_soft_stop_ = [this] { return SoftStopRequested(); };
  callbacks.on_item_uploaded_ = [this, &resume_lock, &resume_set, &run_bytes](
                                    const std::string& file_name, byte_count_t size) {
    {
      std::lock_guard<std::mutex> lock(resume_lock);
      resume_set.insert(file_name);
    }
    run_bytes += size;
    if (bandwidth_) bandwidth_->AddSample(size);
  };

  UploadResult result;
  bool         threw = false;
  std::string  error;
  bool         invoked = false;
  if (!SoftStopRequested()) {
    invoked = true;
    try {
      result = uploader_->Upload(request, callbacks);
    } catch (const std::exception& e) {
      threw = true;
      error = e.what();
    }
  }

  UploadRecord record;
  {
    std::lock_guard<std::mutex> lock(resume_lock);
    record.uploaded_files_ = resume_set;
  }
  record.uploaded_bytes_ = run_bytes.load();
  record.failed_files_   = result.failed_details_;
  record.gallery_id_     = result.gallery_id_;
  record.gallery_url_    = result.gallery_url_;
  if (!threw) {
    auto attempted       = static_cast<uint32_t>(item.uploaded_files_.size()) +
                     result.successful_count_ + result.failed_count_;
    record.total_images_ = std::max(item.total_images_, attempted);
  }

  GalleryQueueItem finished;
  try {
    if (SoftStopRequested()) {
      log->info("{} paused {} with {} images uploaded", path.string(),
                invoked ? "mid-transfer" : "before transfer", record.uploaded_files_.size());
      finished = queue_->MarkPaused(path, record);
    } else if (threw) {
      record.error_message_ = error;
      finished              = queue_->MarkFailed(path, record);
      coordinator_->RecordCompletion(false);
    } else if (result.failed_count_ > 0 && record.uploaded_files_.empty()) {
      record.error_message_ = std::format("All {} images failed", result.failed_count_);
      finished              = queue_->MarkFailed(path, record);
      coordinator_->RecordCompletion(false);
    } else if (result.failed_count_ > 0) {
      record.error_message_ =
          std::format("{} of {} images failed", result.failed_count_, record.total_images_);
      log->warn("{}: {}, kept {} for resume", path.string(), record.error_message_,
                record.uploaded_files_.size());
      finished = queue_->MarkIncomplete(path, record);
      coordinator_->RecordCompletion(false);
    } else {
      finished = queue_->MarkCompleted(path, record);
      coordinator_->RecordCompletion(true);
      log->info("{} completed: {} images, gallery {}", path.string(), finished.uploaded_images_,
                finished.gallery_id_);

      CompletionHandler handler;
      {
        std::lock_guard<std::mutex> lock(config_lock_);
        handler = completion_handler_;
      }
      if (handler) {
        completion_pool_.Submit([handler, finished, result]() { handler(finished, result); });
      }
    }
  } catch (const std::exception& e) {
    return RecoverUnrecordedOutcome(path, e.what());
  }
  item = finished;
  return finished.status_;
}

/**
 * @brief The uploader finished but its outcome could not be written. Make the loss visible
 * and try once to park the item in failed instead of leaving it uploading.
 */
auto UploadWorker::RecoverUnrecordedOutcome(const gallery_path_t& path, const std::string& error)
    -> GalleryStatus {
  auto log = Logger::Get("uploads");
  log->error("Worker {}: could not record the outcome of {}: {}", name_, path.string(), error);
  if (hub_) hub_->PublishLog(path, "Could not record upload outcome: " + error);
  coordinator_->RecordCompletion(false);
  try {
    return queue_->MarkUploadFailed(path, "Could not record upload outcome: " + error).status_;
  } catch (const std::exception& e) {
    log->error("Worker {}: {} is left in uploading: {}", name_, path.string(), e.what());
    return GalleryStatus::UPLOADING;
  }
}

void UploadWorker::RunMaintenanceIfDue() {
  MaintenanceTask           task;
  std::chrono::milliseconds interval;
  {
    std::lock_guard<std::mutex> lock(config_lock_);
    task     = maintenance_task_;
    interval = options_.maintenance_interval_;
  }
  if (!task) {
    return;
  }
  auto now = std::chrono::steady_clock::now();
  if (last_maintenance_ != std::chrono::steady_clock::time_point{} &&
      now - last_maintenance_ < interval) {
    return;
  }
  last_maintenance_ = now;
  try {
    task();
  } catch (const std::exception& e) {
    Logger::Get("uploads")->warn("Worker {}: idle maintenance failed: {}", name_, e.what());
  }
}

void UploadWorker::PublishStats(bool force) {
  if (!hub_) {
    return;
  }
  auto now = std::chrono::steady_clock::now();
  if (!force && now - last_stats_ < kStatsInterval) {
    return;
  }
  last_stats_ = now;

  PipelineEvent stats_event;
  stats_event.type_  = PipelineEventType::QUEUE_STATS;
  stats_event.stats_ = queue_->GetQueueStats();
  hub_->Publish(stats_event);

  if (bandwidth_) {
    PipelineEvent rate_event;
    rate_event.type_ = PipelineEventType::BANDWIDTH;
    rate_event.rate_ = bandwidth_->GetCurrentRate();
    hub_->Publish(rate_event);
  }
}
};  // namespace gallup
