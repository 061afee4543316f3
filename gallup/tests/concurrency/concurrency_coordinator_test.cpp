#include "concurrency/concurrency_coordinator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

namespace gallup {
namespace {
constexpr std::chrono::milliseconds kShort{50};
constexpr std::chrono::milliseconds kLong{5000};
}  // namespace

TEST(ConcurrencyCoordinatorTest, DefaultLimits) {
  ConcurrencyCoordinator coordinator;
  EXPECT_EQ(coordinator.GetGlobalLimit(), 3u);
  EXPECT_EQ(coordinator.GetPerHostLimit(), 2u);
  EXPECT_EQ(coordinator.GetActiveUploadCount(), 0u);
  EXPECT_TRUE(coordinator.CanStartUpload("imx"));
}

TEST(ConcurrencyCoordinatorTest, GlobalAndPerHostLimitsAcrossTwoHosts) {
  ConcurrencyCoordinator coordinator{3, 2};

  auto                   g1 = std::make_optional(coordinator.AcquireSlot(1, "A", kShort));
  auto                   g2 = coordinator.AcquireSlot(2, "A", kShort);
  EXPECT_EQ(coordinator.GetActiveUploadCount("A"), 2u);
  EXPECT_FALSE(coordinator.CanStartUpload("A"));

  // Host B is untouched, so g4 gets in right away
  auto g4 = coordinator.AcquireSlot(4, "B", kShort);
  EXPECT_EQ(coordinator.GetActiveUploadCount(), 3u);

  // Global budget of 3 is gone
  EXPECT_FALSE(coordinator.CanStartUpload("B"));
  EXPECT_THROW(coordinator.AcquireSlot(5, "B", kShort), SlotTimeoutError);
  EXPECT_FALSE(coordinator.IsUploadActive(5, "B"));

  // g3 is issued last on purpose: it takes its global slot before waiting on host A, so a
  // blocked g3 would otherwise hold the third global slot and starve g4
  std::atomic<bool> acquired{false};
  std::thread       waiter([&] {
    auto g3  = coordinator.AcquireSlot(3, "A", kLong);
    acquired = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_FALSE(acquired.load());

  g1.reset();
  waiter.join();
  EXPECT_TRUE(acquired.load());
  EXPECT_EQ(coordinator.GetActiveUploadCount("A"), 1u);
  EXPECT_EQ(coordinator.GetStatistics().total_started_, 4u);
}

TEST(ConcurrencyCoordinatorTest, TimeoutLeavesNoState) {
  ConcurrencyCoordinator coordinator{1, 1};
  auto                   held = coordinator.AcquireSlot(1, "A", kShort);

  EXPECT_THROW(coordinator.AcquireSlot(2, "A", kShort), SlotTimeoutError);
  EXPECT_THROW(coordinator.AcquireSlot(3, "B", kShort), SlotTimeoutError);

  auto stats = coordinator.GetStatistics();
  EXPECT_EQ(stats.active_count_, 1u);
  EXPECT_EQ(stats.total_started_, 1u);
  EXPECT_FALSE(coordinator.IsUploadActive(2, "A"));
  EXPECT_FALSE(coordinator.IsUploadActive(3, "B"));

  held.Release();
  // Host B's gate must not have kept a slot from the failed attempt
  EXPECT_NO_THROW(coordinator.AcquireSlot(3, "B", kShort));
}

TEST(ConcurrencyCoordinatorTest, PerHostTimeoutReturnsGlobalSlot) {
  ConcurrencyCoordinator coordinator{3, 1};
  auto                   held = coordinator.AcquireSlot(1, "A", kShort);

  EXPECT_THROW(coordinator.AcquireSlot(2, "A", kShort), SlotTimeoutError);
  // Two global slots remain: the failed per-host wait gave its global slot back
  auto b1 = coordinator.AcquireSlot(3, "B", kShort);
  auto c1 = coordinator.AcquireSlot(4, "C", kShort);
  EXPECT_EQ(coordinator.GetActiveUploadCount(), 3u);
}

TEST(ConcurrencyCoordinatorTest, ExceptionInGuardedWorkReleasesSlot) {
  ConcurrencyCoordinator coordinator{1, 1};
  try {
    auto guard = coordinator.AcquireSlot(1, "A", kShort);
    throw std::runtime_error("transfer blew up");
  } catch (const std::runtime_error&) {
    coordinator.RecordCompletion(false);
  }

  EXPECT_EQ(coordinator.GetActiveUploadCount(), 0u);
  EXPECT_TRUE(coordinator.CanStartUpload("A"));
  EXPECT_NO_THROW(coordinator.AcquireSlot(2, "A", kShort));
  EXPECT_EQ(coordinator.GetStatistics().total_failed_, 1u);
}

TEST(ConcurrencyCoordinatorTest, GuardReleasesExactlyOnce) {
  ConcurrencyCoordinator coordinator{2, 2};
  auto                   guard = coordinator.AcquireSlot(1, "A", kShort);
  EXPECT_TRUE(guard.IsHeld());

  SlotGuard              moved = std::move(guard);
  EXPECT_FALSE(guard.IsHeld());
  EXPECT_TRUE(moved.IsHeld());
  EXPECT_EQ(moved.GetGalleryId(), 1u);
  EXPECT_EQ(moved.GetHost(), "A");

  moved.Release();
  moved.Release();
  EXPECT_FALSE(moved.IsHeld());
  EXPECT_EQ(coordinator.GetActiveUploadCount(), 0u);

  // Both slots are free again, not over-released
  auto a = coordinator.AcquireSlot(2, "A", kShort);
  auto b = coordinator.AcquireSlot(3, "A", kShort);
  EXPECT_THROW(coordinator.AcquireSlot(4, "A", kShort), SlotTimeoutError);
}

TEST(ConcurrencyCoordinatorTest, SamePairCannotHoldTwoSlots) {
  ConcurrencyCoordinator coordinator;
  auto                   guard = coordinator.AcquireSlot(7, "A", kShort);
  EXPECT_THROW(coordinator.AcquireSlot(7, "A", kShort), std::logic_error);
  EXPECT_NO_THROW(coordinator.AcquireSlot(7, "B", kShort));
}

TEST(ConcurrencyCoordinatorTest, LoweringGlobalLimitKeepsHolders) {
  ConcurrencyCoordinator coordinator{3, 2};
  auto                   first  = std::make_optional(coordinator.AcquireSlot(1, "A", kShort));
  auto                   second = std::make_optional(coordinator.AcquireSlot(2, "A", kShort));

  coordinator.UpdateLimits(1, std::nullopt);
  EXPECT_EQ(coordinator.GetGlobalLimit(), 1u);
  EXPECT_EQ(coordinator.GetActiveUploadCount(), 2u);
  EXPECT_TRUE(coordinator.IsUploadActive(1, "A"));
  EXPECT_TRUE(coordinator.IsUploadActive(2, "A"));

  // Host A is full, so the third waits for one of the two holders
  std::atomic<bool> acquired{false};
  std::thread       waiter([&] {
    auto third = coordinator.AcquireSlot(3, "A", kLong);
    acquired   = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_FALSE(acquired.load());

  first.reset();
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!acquired.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_TRUE(acquired.load());
  EXPECT_TRUE(second->IsHeld());

  // The single slot of the new gate is taken by the third
  EXPECT_THROW(coordinator.AcquireSlot(4, "B", kShort), SlotTimeoutError);
  waiter.join();
}

TEST(ConcurrencyCoordinatorTest, RaisingGlobalLimitAdmitsNewArrivals) {
  ConcurrencyCoordinator coordinator{1, 2};
  auto                   held = coordinator.AcquireSlot(1, "A", kShort);
  EXPECT_THROW(coordinator.AcquireSlot(2, "B", kShort), SlotTimeoutError);

  coordinator.UpdateLimits(2, std::nullopt);
  auto b = coordinator.AcquireSlot(2, "B", kShort);
  auto c = coordinator.AcquireSlot(3, "C", kShort);
  EXPECT_THROW(coordinator.AcquireSlot(4, "D", kShort), SlotTimeoutError);
  EXPECT_EQ(coordinator.GetActiveUploadCount(), 3u);

  // The old holder still releases cleanly into the gate it came from
  held.Release();
  EXPECT_EQ(coordinator.GetActiveUploadCount(), 2u);
  EXPECT_THROW(coordinator.AcquireSlot(4, "D", kShort), SlotTimeoutError);
}

TEST(ConcurrencyCoordinatorTest, AvailableSlotsGlobal) {
  ConcurrencyCoordinator coordinator{3, 2};
  EXPECT_EQ(coordinator.GetAvailableSlots(), 3u);
  {
    auto guard = coordinator.AcquireSlot(1, "A", kShort);
    EXPECT_EQ(coordinator.GetAvailableSlots(), 2u);
  }
  EXPECT_EQ(coordinator.GetAvailableSlots(), 3u);
}

TEST(ConcurrencyCoordinatorTest, AvailableSlotsPerHost) {
  ConcurrencyCoordinator coordinator{5, 2};
  EXPECT_EQ(coordinator.GetAvailableSlots("A"), 2u);
  auto guard = coordinator.AcquireSlot(1, "A", kShort);
  EXPECT_EQ(coordinator.GetAvailableSlots("A"), 1u);
  EXPECT_EQ(coordinator.GetAvailableSlots("B"), 2u);
}

TEST(ConcurrencyCoordinatorTest, AvailableSlotsIsMinimumOfGlobalAndHost) {
  ConcurrencyCoordinator coordinator{1, 5};
  EXPECT_EQ(coordinator.GetAvailableSlots("A"), 1u);
}

TEST(ConcurrencyCoordinatorTest, AvailableSlotsNeverNegative) {
  ConcurrencyCoordinator coordinator{1, 1};
  auto                   guard = coordinator.AcquireSlot(1, "A", kShort);
  EXPECT_EQ(coordinator.GetAvailableSlots(), 0u);
  EXPECT_EQ(coordinator.GetAvailableSlots("A"), 0u);
}

TEST(ConcurrencyCoordinatorTest, PerHostLimitAppliesOnlyToNewHosts) {
  ConcurrencyCoordinator coordinator{10, 1};
  auto                   a1 = coordinator.AcquireSlot(1, "A", kShort);

  coordinator.UpdateLimits(std::nullopt, 3);
  EXPECT_EQ(coordinator.GetPerHostLimit(), 3u);

  // Host A's gate was created with capacity 1 and keeps it
  EXPECT_THROW(coordinator.AcquireSlot(2, "A", kShort), SlotTimeoutError);

  auto b1 = coordinator.AcquireSlot(3, "B", kShort);
  auto b2 = coordinator.AcquireSlot(4, "B", kShort);
  auto b3 = coordinator.AcquireSlot(5, "B", kShort);
  EXPECT_EQ(coordinator.GetActiveUploadCount("B"), 3u);
}

TEST(ConcurrencyCoordinatorTest, StatisticsAndIntrospection) {
  ConcurrencyCoordinator coordinator{3, 2};
  {
    auto a = coordinator.AcquireSlot(1, "A", kShort);
    auto b = coordinator.AcquireSlot(2, "B", kShort);

    auto uploads = coordinator.GetActiveUploads();
    ASSERT_EQ(uploads.size(), 2u);
    EXPECT_NE(std::find(uploads.begin(), uploads.end(), ActiveUpload{1, "A"}), uploads.end());
    EXPECT_NE(std::find(uploads.begin(), uploads.end(), ActiveUpload{2, "B"}), uploads.end());

    auto stats = coordinator.GetStatistics();
    EXPECT_EQ(stats.active_count_, 2u);
    EXPECT_EQ(stats.active_by_host_["A"], 1u);
    EXPECT_EQ(stats.active_by_host_["B"], 1u);
  }
  coordinator.RecordCompletion(true);
  coordinator.RecordCompletion(false);

  auto stats = coordinator.GetStatistics();
  EXPECT_EQ(stats.global_limit_, 3u);
  EXPECT_EQ(stats.per_host_limit_, 2u);
  EXPECT_EQ(stats.active_count_, 0u);
  EXPECT_EQ(stats.total_started_, 2u);
  EXPECT_EQ(stats.total_completed_, 1u);
  EXPECT_EQ(stats.total_failed_, 1u);
}

TEST(ConcurrencyCoordinatorTest, LimitsHoldUnderContention) {
  constexpr uint32_t     kGlobal  = 3;
  constexpr uint32_t     kPerHost = 2;
  ConcurrencyCoordinator coordinator{kGlobal, kPerHost};

  std::atomic<int>       max_total{0};
  std::atomic<bool>      violated{false};
  std::vector<std::thread> threads;
  for (uint32_t i = 0; i < 12; ++i) {
    threads.emplace_back([&, i] {
      const host_name_t host = (i % 2 == 0) ? "A" : "B";
      for (uint32_t round = 0; round < 5; ++round) {
        auto guard = coordinator.AcquireSlot(i * 100 + round, host, kLong);
        auto total = static_cast<int>(coordinator.GetActiveUploadCount());
        if (total > static_cast<int>(kGlobal) ||
            coordinator.GetActiveUploadCount(host) > kPerHost) {
          violated = true;
        }
        int seen = max_total.load();
        while (total > seen && !max_total.compare_exchange_weak(seen, total)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_FALSE(violated.load());
  EXPECT_LE(max_total.load(), static_cast<int>(kGlobal));
  EXPECT_EQ(coordinator.GetActiveUploadCount(), 0u);
  EXPECT_EQ(coordinator.GetStatistics().total_started_, 60u);
}
}  // namespace gallup
