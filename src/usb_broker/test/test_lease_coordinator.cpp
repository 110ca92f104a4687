#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include "test_helpers.hpp"
#include "usb_broker/core/device_registry.hpp"
#include "usb_broker/core/lease_coordinator.hpp"

using namespace std::chrono_literals;
using usb_broker::BrokerError;
using usb_broker::LeaseOptions;
using usb_broker::core::DeviceRecord;
using usb_broker::core::DeviceRegistry;
using usb_broker::core::LeaseCoordinator;
using usb_broker::core::LeaseEndReason;
using usb_broker::core::LeaseListener;
using usb_broker::core::LeaseRecord;
using usb_broker::testing_util::MakeDescriptor;

namespace {

class RecordingListener : public LeaseListener {
public:
  void OnLeaseGranted(const DeviceRecord &, const LeaseRecord &lease) override {
    std::lock_guard<std::mutex> lock(mutex);
    granted.push_back(lease.token);
  }
  void OnLeaseEnded(const DeviceRecord &, const LeaseRecord &lease,
                    LeaseEndReason reason, const std::string &) override {
    std::lock_guard<std::mutex> lock(mutex);
    ended.emplace_back(lease.token, reason);
  }

  std::mutex mutex;
  std::vector<std::string> granted;
  std::vector<std::pair<std::string, LeaseEndReason>> ended;
};

LeaseOptions TestOptions() {
  LeaseOptions o;
  o.default_ttl_ms = 1000;
  o.min_ttl_ms = 10;
  o.max_ttl_ms = 5000;
  o.unbind_timeout_ms = 100;
  return o;
}

}  // namespace

class LeaseCoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    coordinator_.SetListener(listener_);
    ASSERT_EQ(registry_->Register("rack-1", MakeDescriptor("1-1"), &device_),
              BrokerError::kOk);
  }

  std::shared_ptr<DeviceRegistry> registry_ = std::make_shared<DeviceRegistry>();
  LeaseCoordinator coordinator_{registry_, TestOptions()};
  std::shared_ptr<RecordingListener> listener_ =
      std::make_shared<RecordingListener>();
  std::string device_;
};

TEST_F(LeaseCoordinatorTest, AcquireGrantsExclusiveLease) {
  LeaseRecord lease;
  ASSERT_EQ(coordinator_.Acquire(device_, "alice", 0ms, &lease), BrokerError::kOk);
  EXPECT_FALSE(lease.token.empty());
  EXPECT_EQ(lease.consumer_id, "alice");
  EXPECT_EQ(lease.generation, 1u);
  EXPECT_EQ(lease.ttl, 1000ms);

  EXPECT_EQ(coordinator_.Acquire(device_, "bob", 0ms, nullptr), BrokerError::kBusy);

  DeviceRecord rec;
  registry_->Get(device_, &rec);
  EXPECT_EQ(rec.state, broker::v1::DEVICE_STATE_LEASED);
  EXPECT_EQ(listener_->granted.size(), 1u);
}

TEST_F(LeaseCoordinatorTest, AcquireUnknownDeviceIsNotFound) {
  EXPECT_EQ(coordinator_.Acquire("rack-1:9-9", "alice", 0ms, nullptr),
            BrokerError::kNotFound);
}

TEST_F(LeaseCoordinatorTest, AcquireRequiresConsumerId) {
  EXPECT_EQ(coordinator_.Acquire(device_, "", 0ms, nullptr),
            BrokerError::kInvalidArgument);
}

TEST_F(LeaseCoordinatorTest, TtlIsClamped) {
  EXPECT_EQ(coordinator_.ClampTtl(0ms), 1000ms);
  EXPECT_EQ(coordinator_.ClampTtl(1ms), 10ms);
  EXPECT_EQ(coordinator_.ClampTtl(60000ms), 5000ms);
  EXPECT_EQ(coordinator_.ClampTtl(250ms), 250ms);
}

TEST_F(LeaseCoordinatorTest, ConcurrentAcquireGrantsExactlyOne) {
  constexpr int kConsumers = 32;
  std::atomic<int> granted{0};
  std::atomic<int> busy{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kConsumers; ++i) {
    threads.emplace_back([&, i]() {
      BrokerError rc = coordinator_.Acquire(
          device_, "consumer-" + std::to_string(i), 0ms, nullptr);
      if (rc == BrokerError::kOk) ++granted;
      if (rc == BrokerError::kBusy) ++busy;
    });
  }
  for (auto &t : threads) t.join();
  EXPECT_EQ(granted.load(), 1);
  EXPECT_EQ(busy.load(), kConsumers - 1);
}

TEST_F(LeaseCoordinatorTest, ReleaseFreesDevice) {
  LeaseRecord lease;
  coordinator_.Acquire(device_, "alice", 0ms, &lease);
  ASSERT_EQ(coordinator_.Release(lease.token), BrokerError::kOk);

  DeviceRecord rec;
  registry_->Get(device_, &rec);
  EXPECT_EQ(rec.state, broker::v1::DEVICE_STATE_FREE);
  // Second release uses a dead token
  EXPECT_EQ(coordinator_.Release(lease.token), BrokerError::kInvalidToken);
  EXPECT_EQ(coordinator_.Acquire(device_, "bob", 0ms, nullptr), BrokerError::kOk);
}

TEST_F(LeaseCoordinatorTest, LeaseExpiresStrictlyWithoutSweep) {
  LeaseRecord lease;
  ASSERT_EQ(coordinator_.Acquire(device_, "alice", 30ms, &lease), BrokerError::kOk);
  std::this_thread::sleep_for(60ms);

  // Renew after the deadline never revives the lease
  EXPECT_EQ(coordinator_.Renew(lease.token, nullptr), BrokerError::kExpired);
  EXPECT_EQ(coordinator_.Validate(lease.token), BrokerError::kExpired);
  EXPECT_EQ(coordinator_.Acquire(device_, "bob", 0ms, nullptr), BrokerError::kOk);
}

TEST_F(LeaseCoordinatorTest, SweepExpiresAndNotifiesListener) {
  LeaseRecord lease;
  coordinator_.Acquire(device_, "alice", 20ms, &lease);
  std::this_thread::sleep_for(40ms);
  EXPECT_EQ(coordinator_.SweepExpired(), 1u);
  EXPECT_EQ(coordinator_.SweepExpired(), 0u);

  ASSERT_EQ(listener_->ended.size(), 1u);
  EXPECT_EQ(listener_->ended[0].first, lease.token);
  EXPECT_EQ(listener_->ended[0].second, LeaseEndReason::kExpired);
}

TEST_F(LeaseCoordinatorTest, RenewExtendsMonotonically) {
  LeaseRecord lease;
  coordinator_.Acquire(device_, "alice", 200ms, &lease);
  auto previous = lease.expires_at;
  for (int i = 0; i < 5; ++i) {
    std::this_thread::sleep_for(20ms);
    LeaseRecord renewed;
    ASSERT_EQ(coordinator_.Renew(lease.token, &renewed), BrokerError::kOk);
    EXPECT_GE(renewed.expires_at, previous);
    EXPECT_EQ(renewed.generation, lease.generation);
    previous = renewed.expires_at;
  }
}

TEST_F(LeaseCoordinatorTest, StaleTokenAfterReacquireIsInvalid) {
  LeaseRecord first;
  coordinator_.Acquire(device_, "alice", 0ms, &first);
  coordinator_.Release(first.token);

  LeaseRecord second;
  ASSERT_EQ(coordinator_.Acquire(device_, "alice", 0ms, &second), BrokerError::kOk);
  EXPECT_GT(second.generation, first.generation);
  EXPECT_NE(second.token, first.token);

  EXPECT_EQ(coordinator_.Renew(first.token, nullptr), BrokerError::kInvalidToken);
  EXPECT_EQ(coordinator_.Release(first.token), BrokerError::kInvalidToken);
  EXPECT_EQ(coordinator_.Validate(second.token), BrokerError::kOk);
}

TEST_F(LeaseCoordinatorTest, ForgedTokensAreRejected) {
  LeaseRecord lease;
  coordinator_.Acquire(device_, "alice", 0ms, &lease);

  EXPECT_EQ(coordinator_.Renew("garbage", nullptr), BrokerError::kInvalidToken);
  EXPECT_EQ(coordinator_.Renew(device_ + "#1.deadbeef", nullptr),
            BrokerError::kInvalidToken);
  // Token for a device that does not exist
  EXPECT_EQ(coordinator_.Release("rack-9:1-1#1.00"), BrokerError::kInvalidToken);
}

TEST_F(LeaseCoordinatorTest, ParseTokenSplitsDeviceAndGeneration) {
  std::string device;
  uint64_t gen = 0;
  ASSERT_TRUE(LeaseCoordinator::ParseToken("rack-1:1-1#42.abcd", &device, &gen));
  EXPECT_EQ(device, "rack-1:1-1");
  EXPECT_EQ(gen, 42u);

  EXPECT_FALSE(LeaseCoordinator::ParseToken("no-hash", nullptr, nullptr));
  EXPECT_FALSE(LeaseCoordinator::ParseToken("dev#x1.ab", nullptr, nullptr));
  EXPECT_FALSE(LeaseCoordinator::ParseToken("dev#1.", nullptr, nullptr));
}

TEST_F(LeaseCoordinatorTest, ReleaseWithActiveSessionPassesThroughBound) {
  LeaseRecord lease;
  coordinator_.Acquire(device_, "alice", 0ms, &lease);
  ASSERT_EQ(coordinator_.OnSessionState(device_, lease.token, true),
            BrokerError::kOk);
  ASSERT_EQ(coordinator_.Release(lease.token), BrokerError::kOk);

  DeviceRecord rec;
  registry_->Get(device_, &rec);
  EXPECT_EQ(rec.state, broker::v1::DEVICE_STATE_BOUND);
  EXPECT_EQ(coordinator_.Acquire(device_, "bob", 0ms, nullptr), BrokerError::kBusy);

  // Export side confirms unbind
  ASSERT_EQ(coordinator_.OnSessionState(device_, lease.token, false),
            BrokerError::kOk);
  registry_->Get(device_, &rec);
  EXPECT_EQ(rec.state, broker::v1::DEVICE_STATE_FREE);
  EXPECT_EQ(coordinator_.Acquire(device_, "bob", 0ms, nullptr), BrokerError::kOk);
}

TEST_F(LeaseCoordinatorTest, BoundStateTimesOutToFree) {
  LeaseRecord lease;
  coordinator_.Acquire(device_, "alice", 0ms, &lease);
  coordinator_.OnSessionState(device_, lease.token, true);
  coordinator_.Release(lease.token);

  std::this_thread::sleep_for(150ms);
  coordinator_.SweepExpired();

  DeviceRecord rec;
  registry_->Get(device_, &rec);
  EXPECT_EQ(rec.state, broker::v1::DEVICE_STATE_FREE);
}

TEST_F(LeaseCoordinatorTest, RevokeEndsLeaseAndReportsConsumer) {
  LeaseRecord lease;
  coordinator_.Acquire(device_, "alice", 0ms, &lease);

  std::string consumer;
  ASSERT_EQ(coordinator_.Revoke(device_, "stuck", &consumer), BrokerError::kOk);
  EXPECT_EQ(consumer, "alice");
  EXPECT_EQ(coordinator_.Renew(lease.token, nullptr), BrokerError::kInvalidToken);

  ASSERT_EQ(listener_->ended.size(), 1u);
  EXPECT_EQ(listener_->ended[0].second, LeaseEndReason::kRevoked);
}

TEST_F(LeaseCoordinatorTest, RevokeFreeDeviceIsAlreadyFree) {
  EXPECT_EQ(coordinator_.Revoke(device_, "noop"), BrokerError::kAlreadyFree);
  EXPECT_EQ(coordinator_.Revoke("rack-1:9-9", "noop"), BrokerError::kNotFound);
}

TEST_F(LeaseCoordinatorTest, DeregisterTerminatesLeaseAsDeviceRemoved) {
  LeaseRecord lease;
  coordinator_.Acquire(device_, "alice", 0ms, &lease);
  ASSERT_EQ(registry_->Deregister(device_, "unplugged"), BrokerError::kOk);

  ASSERT_EQ(listener_->ended.size(), 1u);
  EXPECT_EQ(listener_->ended[0].second, LeaseEndReason::kDeviceRemoved);
  EXPECT_EQ(coordinator_.Acquire(device_, "bob", 0ms, nullptr),
            BrokerError::kUnreachable);
}

TEST_F(LeaseCoordinatorTest, HostUnreachableTerminatesLease) {
  LeaseRecord lease;
  coordinator_.Acquire(device_, "alice", 0ms, &lease);
  registry_->MarkHostUnreachable("rack-1", "heartbeat timeout");

  ASSERT_EQ(listener_->ended.size(), 1u);
  EXPECT_EQ(listener_->ended[0].second, LeaseEndReason::kHostUnreachable);
  EXPECT_EQ(coordinator_.Validate(lease.token), BrokerError::kInvalidToken);
}

TEST_F(LeaseCoordinatorTest, GenerationNeverReusedAcrossLeases) {
  uint64_t last = 0;
  for (int i = 0; i < 5; ++i) {
    LeaseRecord lease;
    ASSERT_EQ(coordinator_.Acquire(device_, "alice", 0ms, &lease), BrokerError::kOk);
    EXPECT_GT(lease.generation, last);
    last = lease.generation;
    coordinator_.Release(lease.token);
  }
}
