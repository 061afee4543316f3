#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "concurrency/concurrency_coordinator.hpp"
#include "queue/gallery_scanner.hpp"
#include "queue/queue_test_fixation.hpp"
#include "upload/upload_worker.hpp"
#include "upload/uploader.hpp"
#include "utils/bandwidth/bandwidth_tracker.hpp"

namespace gallup {
/**
 * @brief Uploader that "uploads" the images of a local folder in name order, following a
 * script: which files fail, when to throw, and a hook run after each successful image.
 */
class FakeUploader : public Uploader {
 public:
  std::set<std::string>               fail_names_{};
  bool                                throw_before_start_ = false;
  std::set<std::string>               throw_for_galleries_{};
  int                                 throw_after_images_ = -1;
  std::chrono::milliseconds           per_image_delay_{0};
  std::function<void(int uploaded)>   after_image_{};

  std::mutex                          calls_lock_;
  std::vector<UploadRequest>          requests_;
  std::vector<std::string>            uploaded_this_call_;

  std::atomic<int>                    in_flight_{0};
  std::atomic<int>                    max_in_flight_{0};

  auto Upload(const UploadRequest& request, const UploadCallbacks& callbacks)
      -> UploadResult override {
    {
      std::lock_guard<std::mutex> lock(calls_lock_);
      requests_.push_back(request);
      uploaded_this_call_.clear();
    }
    int now_in_flight = ++in_flight_;
    int seen          = max_in_flight_.load();
    while (now_in_flight > seen && !max_in_flight_.compare_exchange_weak(seen, now_in_flight)) {
    }
    struct InFlight {
      std::atomic<int>& counter_;
      ~InFlight() { --counter_; }
    } in_flight{in_flight_};

    if (throw_before_start_ || throw_for_galleries_.contains(request.gallery_name_)) {
      throw std::runtime_error("gallery creation rejected");
    }

    GalleryScanner scanner;
    auto           scanned = scanner.Scan(request.folder_path_);
    std::vector<std::filesystem::path> pending;
    for (const auto& image : scanned.images_) {
      if (!request.already_uploaded_.contains(image.filename().string())) {
        pending.push_back(image);
      }
    }

    UploadResult result;
    result.gallery_id_   = "G-" + request.gallery_name_;
    result.gallery_name_ = request.gallery_name_;
    result.gallery_url_  = "https://host.invalid/g/" + result.gallery_id_;

    int  uploaded = 0;
    auto total    = static_cast<uint32_t>(pending.size());
    for (size_t i = 0; i < pending.size(); ++i) {
      if (callbacks.should_soft_stop_()) {
        break;
      }
      if (per_image_delay_.count() > 0) {
        std::this_thread::sleep_for(per_image_delay_);
      }
      const auto name = pending[i].filename().string();
      if (fail_names_.contains(name)) {
        ++result.failed_count_;
        result.failed_details_.push_back({name, "HTTP 500"});
      } else {
        const auto size = std::filesystem::file_size(pending[i]);
        callbacks.on_item_uploaded_(name, size);
        ++result.successful_count_;
        result.total_size_ += size;
        result.images_.push_back({name, "https://host.invalid/i/" + name, "", size, 0, 0});
        {
          std::lock_guard<std::mutex> lock(calls_lock_);
          uploaded_this_call_.push_back(name);
        }
        ++uploaded;
      }
      callbacks.on_progress_(static_cast<uint32_t>(i + 1), total,
                             100.0 * static_cast<double>(i + 1) / total, name);
      if (after_image_ && !fail_names_.contains(name)) {
        after_image_(uploaded);
      }
      if (throw_after_images_ >= 0 && uploaded >= throw_after_images_) {
        throw std::runtime_error("connection reset by peer");
      }
    }
    callbacks.on_log_("done with " + request.gallery_name_);
    return result;
  }

  auto CallCount() -> size_t {
    std::lock_guard<std::mutex> lock(calls_lock_);
    return requests_.size();
  }

  auto LastRequest() -> UploadRequest {
    std::lock_guard<std::mutex> lock(calls_lock_);
    return requests_.back();
  }

  auto UploadedThisCall() -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(calls_lock_);
    return uploaded_this_call_;
  }
};

class UploadWorkerTests : public QueueTests {
 protected:
  std::shared_ptr<ConcurrencyCoordinator> coordinator_;
  std::shared_ptr<BandwidthTracker>       bandwidth_;
  std::shared_ptr<FakeUploader>           uploader_;
  std::unique_ptr<UploadWorker>           worker_;

  void                                    SetUp() override {
    QueueTests::SetUp();
    coordinator_ = std::make_shared<ConcurrencyCoordinator>(3, 2);
    bandwidth_   = std::make_shared<BandwidthTracker>();
    uploader_    = std::make_shared<FakeUploader>();
    worker_      = MakeWorker("test-worker");
  }

  void TearDown() override {
    worker_.reset();
    QueueTests::TearDown();
  }

  auto MakeWorker(const std::string& name, std::shared_ptr<DiskSpaceMonitor> disk = nullptr)
      -> std::unique_ptr<UploadWorker> {
    auto          worker = std::make_unique<UploadWorker>(name, queue_, coordinator_, disk,
                                                 uploader_, bandwidth_, hub_);
    WorkerOptions options;
    options.slot_timeout_ = std::chrono::milliseconds(200);
    options.idle_wait_    = std::chrono::milliseconds(10);
    worker->SetOptions(options);
    return worker;
  }

  auto QueueGallery(const std::string& name, int images, const host_name_t& host = {})
      -> GalleryQueueItem {
    auto item = queue_->AddGallery(MakeGalleryFolder(name, images), name, host);
    GalleryScanner scanner;
    queue_->ScanItem(item.path_, scanner);
    return queue_->StartItem(item.path_);
  }

  auto WaitForStatus(const gallery_path_t& path, GalleryStatus status,
                     std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      auto item = queue_->GetItem(path);
      if (item.has_value() && item->status_ == status) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
  }
};
}  // namespace gallup
