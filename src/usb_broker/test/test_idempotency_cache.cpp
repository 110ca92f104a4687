#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

#include "usb_broker/core/idempotency_cache.hpp"

using usb_broker::core::Admission;
using usb_broker::core::IdempotencyCache;
using usb_broker::core::IdempotentCall;
using namespace std::chrono_literals;

class IdempotencyCacheTest : public ::testing::Test {
protected:
  // TTL = 3600s (long enough for tests), max = 100 entries
  IdempotencyCache cache_{3600, 100};
};

// ── Basic behaviour ──

TEST_F(IdempotencyCacheTest, MissOnEmpty) {
  std::string out;
  EXPECT_FALSE(cache_.TryGet("acquire", "req-1", &out));
}

TEST_F(IdempotencyCacheTest, HitAfterSet) {
  cache_.Set("acquire", "req-1", "lease-response");
  std::string out;
  EXPECT_TRUE(cache_.TryGet("acquire", "req-1", &out));
  EXPECT_EQ(out, "lease-response");
}

TEST_F(IdempotencyCacheTest, ScopesDoNotCollide) {
  cache_.Set("acquire", "req-1", "acquired");
  cache_.Set("release", "req-1", "released");

  std::string out;
  ASSERT_TRUE(cache_.TryGet("acquire", "req-1", &out));
  EXPECT_EQ(out, "acquired");
  ASSERT_TRUE(cache_.TryGet("release", "req-1", &out));
  EXPECT_EQ(out, "released");
  EXPECT_FALSE(cache_.TryGet("renew", "req-1", &out));
}

TEST_F(IdempotencyCacheTest, EmptyRequestIdIgnored) {
  cache_.Set("acquire", "", "value");
  EXPECT_FALSE(cache_.TryGet("acquire", "", nullptr));
  EXPECT_EQ(cache_.Size(), 0u);
}

TEST_F(IdempotencyCacheTest, OverwriteExisting) {
  cache_.Set("renew", "req-1", "v1");
  cache_.Set("renew", "req-1", "v2");
  std::string out;
  EXPECT_TRUE(cache_.TryGet("renew", "req-1", &out));
  EXPECT_EQ(out, "v2");
  EXPECT_EQ(cache_.Size(), 1u);
}

// ── Capacity eviction ──

TEST_F(IdempotencyCacheTest, EvictsOldestWhenFull) {
  for (int i = 0; i < 100; ++i) {
    cache_.Set("acquire", "req-" + std::to_string(i), "val");
  }
  cache_.Set("acquire", "req-100", "val");

  EXPECT_EQ(cache_.Size(), 100u);
  EXPECT_FALSE(cache_.TryGet("acquire", "req-0", nullptr));
  EXPECT_TRUE(cache_.TryGet("acquire", "req-1", nullptr));
  EXPECT_TRUE(cache_.TryGet("acquire", "req-100", nullptr));
}

TEST_F(IdempotencyCacheTest, UpdateRefreshesLruPosition) {
  for (int i = 0; i < 100; ++i) {
    cache_.Set("acquire", "req-" + std::to_string(i), "val");
  }
  // Touching req-0 makes req-1 the oldest
  cache_.Set("acquire", "req-0", "val2");
  cache_.Set("acquire", "req-100", "val");

  EXPECT_TRUE(cache_.TryGet("acquire", "req-0", nullptr));
  EXPECT_FALSE(cache_.TryGet("acquire", "req-1", nullptr));
}

// ── Expiry ──

TEST(IdempotencyCacheExpiryTest, EntriesExpireAfterTtl) {
  IdempotencyCache cache(1, 10);
  cache.Set("attach", "req-1", "value");
  EXPECT_TRUE(cache.TryGet("attach", "req-1", nullptr));

  std::this_thread::sleep_for(std::chrono::milliseconds(1100));
  EXPECT_FALSE(cache.TryGet("attach", "req-1", nullptr));
}

TEST(IdempotencyCacheExpiryTest, CleanupRemovesExpired) {
  IdempotencyCache cache(1, 10);
  cache.Set("attach", "req-1", "a");
  cache.Set("attach", "req-2", "b");
  std::this_thread::sleep_for(std::chrono::milliseconds(1100));
  cache.Cleanup();
  EXPECT_EQ(cache.Size(), 0u);
}

// ── In-flight reservation ──

TEST_F(IdempotencyCacheTest, FirstBeginExecutesThenReplays) {
  std::string out;
  EXPECT_EQ(cache_.Begin("renew", "req-1", &out, 0ms), Admission::kExecute);
  // Not visible to TryGet until the result is recorded
  EXPECT_FALSE(cache_.TryGet("renew", "req-1", &out));
  cache_.Set("renew", "req-1", "renewed");
  EXPECT_EQ(cache_.Begin("renew", "req-1", &out, 0ms), Admission::kReplay);
  EXPECT_EQ(out, "renewed");
}

TEST_F(IdempotencyCacheTest, ConcurrentDuplicatesWaitForFirstResult) {
  std::atomic<int> executed{0};
  std::atomic<int> replayed{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      IdempotentCall call(cache_, "acquire", "req-1", 2000ms);
      if (call.admission() == Admission::kExecute) {
        ++executed;
        std::this_thread::sleep_for(50ms);
        call.Complete("token-1");
      } else if (call.admission() == Admission::kReplay &&
                 call.cached_response() == "token-1") {
        ++replayed;
      }
    });
  }
  for (auto &t : threads) t.join();
  EXPECT_EQ(executed.load(), 1);
  EXPECT_EQ(replayed.load(), 7);
}

TEST_F(IdempotencyCacheTest, DuplicateTimesOutWhileFirstRuns) {
  ASSERT_EQ(cache_.Begin("acquire", "req-1", nullptr, 0ms), Admission::kExecute);
  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(cache_.Begin("acquire", "req-1", nullptr, 50ms), Admission::kInFlight);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST_F(IdempotencyCacheTest, AbandonedCallLetsRetryExecute) {
  {
    IdempotentCall call(cache_, "register", "req-1", 0ms);
    ASSERT_EQ(call.admission(), Admission::kExecute);
    // Scope ends without Complete (early error return)
  }
  EXPECT_EQ(cache_.Size(), 0u);
  IdempotentCall retry(cache_, "register", "req-1", 0ms);
  EXPECT_EQ(retry.admission(), Admission::kExecute);
}

TEST_F(IdempotencyCacheTest, WaiterTakesOverAfterAbandon) {
  ASSERT_EQ(cache_.Begin("attach", "req-1", nullptr, 0ms), Admission::kExecute);
  std::thread owner([this]() {
    std::this_thread::sleep_for(50ms);
    cache_.Abandon("attach", "req-1");
  });
  EXPECT_EQ(cache_.Begin("attach", "req-1", nullptr, 2000ms), Admission::kExecute);
  owner.join();
}

TEST_F(IdempotencyCacheTest, EmptyRequestIdAlwaysExecutes) {
  EXPECT_EQ(cache_.Begin("acquire", "", nullptr, 0ms), Admission::kExecute);
  EXPECT_EQ(cache_.Begin("acquire", "", nullptr, 0ms), Admission::kExecute);
  EXPECT_EQ(cache_.Size(), 0u);
}
