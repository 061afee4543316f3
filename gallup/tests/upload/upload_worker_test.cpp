#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "storage/queue_store.hpp"
#include "upload_test_fixation.hpp"

namespace gallup {
namespace {
// Delegates to a real store but refuses to persist items in the given statuses
class RefusingStore : public QueueStore {
 public:
  RefusingStore(std::shared_ptr<QueueStore> inner, std::set<GalleryStatus> refused)
      : inner_(std::move(inner)), refused_(std::move(refused)) {}

  auto GetNextQueued(const std::set<gallery_path_t>& exclude)
      -> std::optional<GalleryQueueItem> override {
    return inner_->GetNextQueued(exclude);
  }
  auto GetItem(const gallery_path_t& path) -> std::optional<GalleryQueueItem> override {
    return inner_->GetItem(path);
  }
  auto GetAllItems() -> std::vector<GalleryQueueItem> override { return inner_->GetAllItems(); }
  void UpdateStatus(const gallery_path_t& path, GalleryStatus status) override {
    if (refused_.contains(status)) throw std::runtime_error("disk I/O error");
    inner_->UpdateStatus(path, status);
  }
  void UpsertItems(std::span<GalleryQueueItem> items) override {
    for (const auto& item : items) {
      if (refused_.contains(item.status_)) throw std::runtime_error("disk I/O error");
    }
    inner_->UpsertItems(items);
  }
  auto RemoveItem(const gallery_path_t& path) -> bool override { return inner_->RemoveItem(path); }
  auto GetStats() -> QueueStats override { return inner_->GetStats(); }

 private:
  std::shared_ptr<QueueStore> inner_;
  std::set<GalleryStatus>     refused_;
};
};  // namespace

TEST_F(UploadWorkerTests, CompletedRunRecordsEverything) {
  auto item = QueueGallery("complete", 5);

  std::promise<std::pair<GalleryQueueItem, UploadResult>> done;
  worker_->SetCompletionHandler([&done](const GalleryQueueItem& finished, const UploadResult& result) {
    done.set_value({finished, result});
  });

  EXPECT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);

  auto stored = queue_->GetItem(item.path_);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status_, GalleryStatus::COMPLETED);
  EXPECT_EQ(stored->uploaded_images_, 5u);
  EXPECT_EQ(stored->total_images_, 5u);
  EXPECT_EQ(stored->uploaded_bytes_, 5u * 128u);
  EXPECT_EQ(stored->gallery_id_, "G-complete");
  EXPECT_TRUE(stored->uploaded_files_.empty());

  EXPECT_EQ(coordinator_->GetActiveUploadCount(), 0u);
  EXPECT_EQ(coordinator_->GetStatistics().total_completed_, 1u);
  EXPECT_EQ(bandwidth_->GetTotalBytes(), 5u * 128u);
  EXPECT_FALSE(queue_->IsClaimed(item.path_));
  EXPECT_FALSE(worker_->GetCurrentItem().has_value());

  auto handled = done.get_future();
  ASSERT_EQ(handled.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  auto [finished, result] = handled.get();
  EXPECT_EQ(finished.status_, GalleryStatus::COMPLETED);
  EXPECT_EQ(result.successful_count_, 5u);

  auto statuses = StatusEventsFor(item.path_);
  ASSERT_GE(statuses.size(), 2u);
  EXPECT_EQ(statuses[statuses.size() - 2], GalleryStatus::UPLOADING);
  EXPECT_EQ(statuses.back(), GalleryStatus::COMPLETED);
}

TEST_F(UploadWorkerTests, PartialFailureResumesWithOnlyTheMissingImages) {
  auto item              = QueueGallery("partial", 10);
  uploader_->fail_names_ = {"008.jpg", "009.jpg", "010.jpg"};

  ASSERT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);
  auto first = queue_->GetItem(item.path_);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->status_, GalleryStatus::INCOMPLETE);
  EXPECT_EQ(first->uploaded_files_.size(), 7u);
  EXPECT_EQ(first->uploaded_images_, 7u);
  EXPECT_EQ(first->failed_files_.size(), 3u);
  EXPECT_FALSE(first->uploaded_files_.contains("008.jpg"));
  EXPECT_EQ(coordinator_->GetStatistics().total_failed_, 1u);

  uploader_->fail_names_.clear();
  queue_->StartItem(item.path_);
  ASSERT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);

  auto request = uploader_->LastRequest();
  EXPECT_EQ(request.already_uploaded_, first->uploaded_files_);
  auto second_run = uploader_->UploadedThisCall();
  ASSERT_EQ(second_run.size(), 3u);
  EXPECT_EQ(second_run[0], "008.jpg");
  EXPECT_EQ(second_run[2], "010.jpg");

  auto second = queue_->GetItem(item.path_);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->status_, GalleryStatus::COMPLETED);
  EXPECT_EQ(second->uploaded_images_, 10u);
  EXPECT_TRUE(second->uploaded_files_.empty());
  EXPECT_TRUE(second->failed_files_.empty());
  EXPECT_EQ(second->uploaded_bytes_, 10u * 128u);
}

TEST_F(UploadWorkerTests, StopMidTransferPausesWithProgressKept) {
  auto item               = QueueGallery("stopped", 10);
  uploader_->after_image_ = [this](int uploaded) {
    if (uploaded == 4) {
      worker_->StopCurrentUpload();
    }
  };

  ASSERT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);

  auto stored = queue_->GetItem(item.path_);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status_, GalleryStatus::PAUSED);
  EXPECT_EQ(stored->uploaded_files_.size(), 4u);
  EXPECT_EQ(stored->uploaded_images_, 4u);
  EXPECT_TRUE(stored->error_message_.empty());

  // Paused is neither a success nor a failure for the coordinator
  auto stats = coordinator_->GetStatistics();
  EXPECT_EQ(stats.total_completed_, 0u);
  EXPECT_EQ(stats.total_failed_, 0u);
  EXPECT_EQ(coordinator_->GetActiveUploadCount(), 0u);
}

TEST_F(UploadWorkerTests, ResumedPausedItemSkipsUploadedImages) {
  auto item               = QueueGallery("resume", 6);
  uploader_->after_image_ = [this](int uploaded) {
    if (uploaded == 2) {
      worker_->StopCurrentUpload();
    }
  };
  ASSERT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);
  uploader_->after_image_ = nullptr;

  queue_->StartItem(item.path_);
  ASSERT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);

  EXPECT_EQ(uploader_->LastRequest().already_uploaded_.size(), 2u);
  EXPECT_EQ(uploader_->UploadedThisCall().size(), 4u);
  auto stored = queue_->GetItem(item.path_);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status_, GalleryStatus::COMPLETED);
  EXPECT_EQ(stored->uploaded_images_, 6u);
}

TEST_F(UploadWorkerTests, SoftStopWinsOverException) {
  auto item                      = QueueGallery("stop_then_throw", 5);
  uploader_->throw_after_images_ = 2;
  uploader_->after_image_        = [this](int uploaded) {
    if (uploaded == 2) {
      worker_->StopCurrentUpload();
    }
  };

  ASSERT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);

  auto stored = queue_->GetItem(item.path_);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status_, GalleryStatus::PAUSED);
  EXPECT_EQ(stored->uploaded_files_.size(), 2u);
  EXPECT_EQ(coordinator_->GetStatistics().total_failed_, 0u);
}

TEST_F(UploadWorkerTests, ExceptionMarksFailedAndKeepsProgress) {
  auto item                      = QueueGallery("reset", 5);
  uploader_->throw_after_images_ = 3;

  ASSERT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);

  auto stored = queue_->GetItem(item.path_);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status_, GalleryStatus::FAILED);
  EXPECT_EQ(stored->error_message_, "connection reset by peer");
  EXPECT_EQ(stored->uploaded_files_.size(), 3u);
  EXPECT_EQ(coordinator_->GetStatistics().total_failed_, 1u);
  EXPECT_EQ(coordinator_->GetActiveUploadCount(), 0u);
  EXPECT_FALSE(queue_->IsClaimed(item.path_));
}

TEST_F(UploadWorkerTests, AllImagesFailingMarksFailed) {
  auto item              = QueueGallery("all_bad", 3);
  uploader_->fail_names_ = {"001.jpg", "002.jpg", "003.jpg"};

  ASSERT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);

  auto stored = queue_->GetItem(item.path_);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status_, GalleryStatus::FAILED);
  EXPECT_EQ(stored->failed_files_.size(), 3u);
  EXPECT_EQ(stored->error_message_, "All 3 images failed");
}

TEST_F(UploadWorkerTests, StopBeforeTransferNeverCallsUploader) {
  auto item = QueueGallery("early", 3);
  hub_->Subscribe([this, path = item.path_](const PipelineEvent& event) {
    if (event.type_ == PipelineEventType::STATUS_CHANGED && event.path_ == path &&
        event.status_ == GalleryStatus::UPLOADING) {
      worker_->StopCurrentUpload();
    }
  });

  ASSERT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);

  EXPECT_EQ(uploader_->CallCount(), 0u);
  auto stored = queue_->GetItem(item.path_);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status_, GalleryStatus::PAUSED);
  EXPECT_TRUE(stored->uploaded_files_.empty());
}

TEST_F(UploadWorkerTests, EmergencyDiskTierKeepsItemQueued) {
  auto data_dir = root_ / "data";
  auto temp_dir = root_ / "temp";
  std::filesystem::create_directories(data_dir);
  std::filesystem::create_directories(temp_dir);
  auto disk = std::make_shared<DiskSpaceMonitor>(
      data_dir, temp_dir, DiskThresholds::FromMegabytes(2048, 512, 100),
      [](const std::filesystem::path&) -> byte_count_t { return 50 * kMegabyte; });
  disk->Poll();
  ASSERT_EQ(disk->GetCurrentTier(), DiskTier::EMERGENCY);

  auto guarded = MakeWorker("disk-worker", disk);
  auto item    = QueueGallery("no_space", 2);

  EXPECT_EQ(guarded->ProcessNext(), WorkerStep::REFUSED);
  EXPECT_EQ(uploader_->CallCount(), 0u);
  auto stored = queue_->GetItem(item.path_);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status_, GalleryStatus::QUEUED);
  EXPECT_FALSE(queue_->IsClaimed(item.path_));
}

TEST_F(UploadWorkerTests, BusyHostKeepsItemQueued) {
  auto held_a = coordinator_->AcquireSlot(900, "imx", std::chrono::milliseconds(100));
  auto held_b = coordinator_->AcquireSlot(901, "imx", std::chrono::milliseconds(100));
  auto item   = QueueGallery("busy", 2);

  EXPECT_EQ(worker_->ProcessNext(), WorkerStep::REFUSED);
  EXPECT_EQ(uploader_->CallCount(), 0u);
  EXPECT_EQ(queue_->GetItem(item.path_)->status_, GalleryStatus::QUEUED);
  EXPECT_FALSE(queue_->IsClaimed(item.path_));

  held_a.Release();
  EXPECT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);
  EXPECT_EQ(queue_->GetItem(item.path_)->status_, GalleryStatus::COMPLETED);
}

TEST_F(UploadWorkerTests, ItemHostOverridesDefaultHost) {
  QueueGallery("default_host", 1);
  ASSERT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);
  EXPECT_EQ(uploader_->LastRequest().host_, "imx");

  QueueGallery("own_host", 1, "pixhost");
  ASSERT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);
  EXPECT_EQ(uploader_->LastRequest().host_, "pixhost");
}

TEST_F(UploadWorkerTests, RunConfigIsSnapshotPerItem) {
  UploadConfig config;
  config.max_retries_   = 7;
  config.template_name_ = "plain";
  worker_->SetRunConfig(config);

  auto           item = queue_->AddGallery(MakeGalleryFolder("templated", 1), "templated", {}, "fancy");
  GalleryScanner scanner;
  queue_->ScanItem(item.path_, scanner);
  queue_->StartItem(item.path_);

  ASSERT_EQ(worker_->ProcessNext(), WorkerStep::PROCESSED);
  auto request = uploader_->LastRequest();
  EXPECT_EQ(request.config_.max_retries_, 7u);
  EXPECT_EQ(request.config_.template_name_, "fancy");
  EXPECT_EQ(worker_->GetRunConfig().template_name_, "plain");
}

TEST_F(UploadWorkerTests, IdleRunsMaintenanceAtMostOncePerInterval) {
  std::atomic<int> runs{0};
  worker_->SetMaintenanceTask([&runs]() { ++runs; });

  EXPECT_EQ(worker_->ProcessNext(), WorkerStep::IDLE);
  EXPECT_EQ(worker_->ProcessNext(), WorkerStep::IDLE);
  EXPECT_EQ(runs.load(), 1);
}

TEST_F(UploadWorkerTests, LoopDrainsQueueAndSurvivesFailures) {
  uploader_->throw_for_galleries_ = {"broken"};
  auto broken                     = QueueGallery("broken", 2);
  auto first                      = QueueGallery("first", 2);
  auto second                     = QueueGallery("second", 3);

  worker_->Start();
  EXPECT_TRUE(worker_->IsRunning());
  EXPECT_TRUE(WaitForStatus(broken.path_, GalleryStatus::FAILED));
  EXPECT_TRUE(WaitForStatus(first.path_, GalleryStatus::COMPLETED));
  EXPECT_TRUE(WaitForStatus(second.path_, GalleryStatus::COMPLETED));
  worker_->Stop();
  EXPECT_FALSE(worker_->IsRunning());
  EXPECT_EQ(queue_->GetItem(broken.path_)->error_message_, "gallery creation rejected");
}

TEST_F(UploadWorkerTests, StopUnwindsTheItemInFlight) {
  uploader_->per_image_delay_ = std::chrono::milliseconds(20);
  auto item                   = QueueGallery("long", 200);

  worker_->Start();
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!worker_->GetCurrentItem().has_value() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_TRUE(worker_->GetCurrentItem().has_value());
  worker_->Stop();

  auto stored = queue_->GetItem(item.path_);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status_, GalleryStatus::PAUSED);
  EXPECT_LT(stored->uploaded_files_.size(), 200u);
  EXPECT_EQ(coordinator_->GetActiveUploadCount(), 0u);
}

TEST_F(UploadWorkerTests, PausedWorkerTakesNoNewItems) {
  worker_->Pause();
  worker_->Start();
  auto item = QueueGallery("held", 2);

  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  EXPECT_TRUE(worker_->IsPaused());
  EXPECT_EQ(queue_->GetItem(item.path_)->status_, GalleryStatus::QUEUED);
  EXPECT_EQ(uploader_->CallCount(), 0u);

  worker_->Resume();
  EXPECT_TRUE(WaitForStatus(item.path_, GalleryStatus::COMPLETED));
  worker_->Stop();
}

TEST_F(UploadWorkerTests, WorkersSharingCoordinatorRespectGlobalLimit) {
  coordinator_->UpdateLimits(1, std::nullopt);
  uploader_->per_image_delay_ = std::chrono::milliseconds(5);

  std::vector<GalleryQueueItem> items;
  for (int i = 0; i < 4; ++i) {
    items.push_back(QueueGallery("shared_" + std::to_string(i), 3));
  }
  std::vector<std::unique_ptr<UploadWorker>> workers;
  for (int i = 0; i < 3; ++i) {
    workers.push_back(MakeWorker("worker-" + std::to_string(i)));
    workers.back()->Start();
  }
  for (const auto& item : items) {
    EXPECT_TRUE(WaitForStatus(item.path_, GalleryStatus::COMPLETED));
  }
  for (auto& worker : workers) {
    worker->Stop();
  }

  EXPECT_EQ(uploader_->max_in_flight_.load(), 1);
  EXPECT_EQ(uploader_->CallCount(), 4u);
  EXPECT_EQ(coordinator_->GetStatistics().total_completed_, 4u);
}

TEST_F(UploadWorkerTests, UnrecordableOutcomeFallsBackToFailed) {
  auto item     = QueueGallery("unrecordable", 3);
  auto refusing = std::make_shared<RefusingStore>(
      store_, std::set<GalleryStatus>{GalleryStatus::COMPLETED});
  auto queue    = std::make_shared<QueueManager>(refusing, hub_);
  UploadWorker worker("refusing-worker", queue, coordinator_, nullptr, uploader_, bandwidth_, hub_);

  EXPECT_EQ(worker.ProcessNext(), WorkerStep::PROCESSED);

  auto stored = queue->GetItem(item.path_);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status_, GalleryStatus::FAILED);
  EXPECT_NE(stored->error_message_.find("disk I/O error"), std::string::npos);
  EXPECT_EQ(coordinator_->GetActiveUploadCount(), 0u);
  EXPECT_EQ(coordinator_->GetStatistics().total_failed_, 1u);
  EXPECT_FALSE(queue->IsClaimed(item.path_));
}

TEST_F(UploadWorkerTests, UnwritableStoreIsReportedNotThrown) {
  auto item     = QueueGallery("unwritable", 2);
  auto refusing = std::make_shared<RefusingStore>(
      store_, std::set<GalleryStatus>{GalleryStatus::COMPLETED, GalleryStatus::FAILED});
  auto queue    = std::make_shared<QueueManager>(refusing, hub_);
  UploadWorker worker("refusing-worker", queue, coordinator_, nullptr, uploader_, bandwidth_, hub_);

  WorkerStep step = WorkerStep::IDLE;
  EXPECT_NO_THROW(step = worker.ProcessNext());
  EXPECT_EQ(step, WorkerStep::PROCESSED);

  EXPECT_EQ(queue->GetItem(item.path_)->status_, GalleryStatus::UPLOADING);
  EXPECT_EQ(coordinator_->GetActiveUploadCount(), 0u);
  EXPECT_FALSE(queue->IsClaimed(item.path_));

  std::lock_guard<std::mutex> lock(events_lock_);
  bool                        reported = false;
  for (const auto& event : events_) {
    if (event.type_ == PipelineEventType::LOG && event.path_ == item.path_ &&
        event.message_.find("Could not record upload outcome") != std::string::npos) {
      reported = true;
    }
  }
  EXPECT_TRUE(reported);
}
}  // namespace gallup
