#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

#include "test_helpers.hpp"
#include "usb_broker/core/device_registry.hpp"
#include "usb_broker/core/event_buffer.hpp"

using usb_broker::BrokerError;
using usb_broker::core::DeviceQuery;
using usb_broker::core::DeviceRecord;
using usb_broker::core::DeviceRegistry;
using usb_broker::core::EventBuffer;
using usb_broker::testing_util::MakeDescriptor;

class DeviceRegistryTest : public ::testing::Test {
protected:
  void SetUp() override { registry_.SetEventBuffer(events_); }

  std::shared_ptr<EventBuffer> events_ = std::make_shared<EventBuffer>(100);
  DeviceRegistry registry_{std::chrono::milliseconds(50)};
};

TEST_F(DeviceRegistryTest, RegisterAssignsHostScopedId) {
  std::string id;
  broker::v1::DeviceState state;
  ASSERT_EQ(registry_.Register("rack-1", MakeDescriptor("1-2.3"), &id, &state),
            BrokerError::kOk);
  EXPECT_EQ(id, "rack-1:1-2.3");
  EXPECT_EQ(state, broker::v1::DEVICE_STATE_FREE);
  EXPECT_EQ(registry_.Size(), 1u);
}

TEST_F(DeviceRegistryTest, RegisterIsIdempotent) {
  std::string first, second;
  ASSERT_EQ(registry_.Register("rack-1", MakeDescriptor("1-1"), &first),
            BrokerError::kOk);
  auto updated = MakeDescriptor("1-1");
  updated.set_product("Renamed");
  ASSERT_EQ(registry_.Register("rack-1", updated, &second), BrokerError::kOk);

  EXPECT_EQ(first, second);
  EXPECT_EQ(registry_.Size(), 1u);

  DeviceRecord rec;
  ASSERT_EQ(registry_.Get(first, &rec), BrokerError::kOk);
  EXPECT_EQ(rec.descriptor.product(), "Renamed");
}

TEST_F(DeviceRegistryTest, SameBusPathOnDifferentHostsAreDistinct) {
  std::string a, b;
  registry_.Register("rack-1", MakeDescriptor("1-1"), &a);
  registry_.Register("rack-2", MakeDescriptor("1-1"), &b);
  EXPECT_NE(a, b);
  EXPECT_EQ(registry_.Size(), 2u);
}

TEST_F(DeviceRegistryTest, RejectsInvalidIdentifiers) {
  EXPECT_EQ(registry_.Register("", MakeDescriptor("1-1"), nullptr),
            BrokerError::kInvalidArgument);
  EXPECT_EQ(registry_.Register("rack 1", MakeDescriptor("1-1"), nullptr),
            BrokerError::kInvalidArgument);
  EXPECT_EQ(registry_.Register("rack-1", MakeDescriptor("../etc"), nullptr),
            BrokerError::kInvalidArgument);
  EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(DeviceRegistryTest, ConcurrentRegisterCreatesSingleRecord) {
  std::vector<std::thread> threads;
  std::atomic<int> ok{0};
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&]() {
      if (registry_.Register("rack-1", MakeDescriptor("2-4"), nullptr) ==
          BrokerError::kOk) {
        ++ok;
      }
    });
  }
  for (auto &t : threads) t.join();
  EXPECT_EQ(ok.load(), 16);
  EXPECT_EQ(registry_.Size(), 1u);
}

TEST_F(DeviceRegistryTest, GetUnknownDeviceIsNotFound) {
  EXPECT_EQ(registry_.Get("rack-1:9-9", nullptr), BrokerError::kNotFound);
  EXPECT_EQ(registry_.Deregister("rack-1:9-9", "gone"), BrokerError::kNotFound);
}

TEST_F(DeviceRegistryTest, DeregisterMarksRemovedThenPurges) {
  std::string id;
  registry_.Register("rack-1", MakeDescriptor("1-1"), &id);
  ASSERT_EQ(registry_.Deregister(id, "unplugged"), BrokerError::kOk);

  DeviceRecord rec;
  ASSERT_EQ(registry_.Get(id, &rec), BrokerError::kOk);
  EXPECT_EQ(rec.state, broker::v1::DEVICE_STATE_UNREACHABLE);
  EXPECT_TRUE(rec.removed);

  // Within grace nothing is purged
  EXPECT_EQ(registry_.PurgeUnreachable(), 0u);
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  EXPECT_EQ(registry_.PurgeUnreachable(), 1u);
  EXPECT_EQ(registry_.Get(id, nullptr), BrokerError::kNotFound);
}

TEST_F(DeviceRegistryTest, ReRegisterWithinGraceRevivesDevice) {
  std::string id;
  registry_.Register("rack-1", MakeDescriptor("1-1"), &id);
  registry_.Deregister(id, "unplugged");

  broker::v1::DeviceState state;
  ASSERT_EQ(registry_.Register("rack-1", MakeDescriptor("1-1"), nullptr, &state),
            BrokerError::kOk);
  EXPECT_EQ(state, broker::v1::DEVICE_STATE_FREE);
}

TEST_F(DeviceRegistryTest, MarkHostUnreachableOnlyAffectsThatHost) {
  std::string a1, a2, b1;
  registry_.Register("rack-a", MakeDescriptor("1-1"), &a1);
  registry_.Register("rack-a", MakeDescriptor("1-2"), &a2);
  registry_.Register("rack-b", MakeDescriptor("1-1"), &b1);

  EXPECT_EQ(registry_.MarkHostUnreachable("rack-a", "heartbeat timeout"), 2u);
  // Second call is a no-op
  EXPECT_EQ(registry_.MarkHostUnreachable("rack-a", "heartbeat timeout"), 0u);

  DeviceRecord rec;
  registry_.Get(a1, &rec);
  EXPECT_EQ(rec.state, broker::v1::DEVICE_STATE_UNREACHABLE);
  EXPECT_FALSE(rec.removed);
  registry_.Get(b1, &rec);
  EXPECT_EQ(rec.state, broker::v1::DEVICE_STATE_FREE);
}

TEST_F(DeviceRegistryTest, ListFiltersAndSortsById) {
  registry_.Register("rack-b", MakeDescriptor("1-1", 0x1234), nullptr);
  registry_.Register("rack-a", MakeDescriptor("1-2"), nullptr);
  registry_.Register("rack-a", MakeDescriptor("1-1"), nullptr);
  registry_.MarkHostUnreachable("rack-b", "test");

  auto all = registry_.List(DeviceQuery{});
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].device_id, "rack-a:1-1");
  EXPECT_EQ(all[1].device_id, "rack-a:1-2");
  EXPECT_EQ(all[2].device_id, "rack-b:1-1");

  DeviceQuery by_host;
  by_host.host_id = "rack-a";
  EXPECT_EQ(registry_.List(by_host).size(), 2u);

  DeviceQuery by_state;
  by_state.state = broker::v1::DEVICE_STATE_UNREACHABLE;
  ASSERT_EQ(registry_.List(by_state).size(), 1u);

  DeviceQuery by_vendor;
  by_vendor.vendor_id = 0x1234;
  EXPECT_EQ(registry_.List(by_vendor).size(), 1u);
}

TEST_F(DeviceRegistryTest, RegisterEmitsEvents) {
  registry_.Register("rack-1", MakeDescriptor("1-1"), nullptr);
  auto events = events_->GetLatestEvents(10);
  ASSERT_GE(events.size(), 1u);
  EXPECT_EQ(events[0].type(), broker::v1::EVENT_TYPE_DEVICE_REGISTERED);
  EXPECT_EQ(events[0].device_id(), "rack-1:1-1");
}
