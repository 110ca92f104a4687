#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include "broker.grpc.pb.h"
#include "test_helpers.hpp"
#include "usb_broker/agent/broker_client.hpp"
#include "usb_broker/broker_gateway.hpp"
#include "usb_broker/common/utils.hpp"
#include "usb_broker/core/device_registry.hpp"

using namespace std::chrono_literals;
using usb_broker::BrokerConfig;
using usb_broker::BrokerError;
using usb_broker::BrokerGateway;
using usb_broker::agent::BrokerClient;
using usb_broker::agent::LeaseGrant;
using usb_broker::testing_util::MakeDescriptor;
using usb_broker::testing_util::WaitUntil;

namespace {

BrokerConfig TestBrokerConfig() {
  BrokerConfig cfg;
  cfg.sweep_interval_ms = 20;
  cfg.host_heartbeat_timeout_ms = 1000;
  cfg.purge_grace_ms = 60000;
  cfg.lease.default_ttl_ms = 2000;
  cfg.lease.min_ttl_ms = 50;
  cfg.lease.unbind_timeout_ms = 200;
  cfg.host_credentials = {{"rack-1", "s3cret"}};
  return cfg;
}

}  // namespace

class BrokerGatewayTest : public ::testing::Test {
protected:
  virtual BrokerConfig MakeConfig() const { return TestBrokerConfig(); }

  void SetUp() override {
    gateway_ = std::make_unique<BrokerGateway>(MakeConfig());
    ASSERT_TRUE(gateway_->Start(false));
    channel_ = gateway_->InProcessChannel();
    client_ = std::make_unique<BrokerClient>(channel_, 2000ms);
  }

  void TearDown() override {
    client_->CancelWatch();
    if (watcher_.joinable()) watcher_.join();
    gateway_->Stop();
  }

  // Registers rack-1 and reports one device, returning its id.
  std::string RegisterRack(const std::string &bus_path = "1-1") {
    const int64_t ts = usb_broker::UnixSeconds();
    const std::string address = "rack-1:50062";
    const std::string sig = usb_broker::ComputeHmacSha256Hex(
        "s3cret", usb_broker::HostSignaturePayload("rack-1", address, ts));
    EXPECT_EQ(client_->RegisterHost("rack-1", address, ts, sig, &host_token_),
              BrokerError::kOk);
    std::string device_id;
    EXPECT_EQ(client_->ReportDevice("rack-1", host_token_, MakeDescriptor(bus_path),
                                    &device_id),
              BrokerError::kOk);
    return device_id;
  }

  void StartWatching() {
    watcher_ = std::thread([this]() {
      client_->WatchCommands("rack-1", host_token_,
                             [this](const broker::v1::HostCommand &cmd) {
                               std::lock_guard<std::mutex> lock(commands_mutex_);
                               commands_.push_back(cmd);
                             });
    });
  }

  size_t CommandCount() {
    std::lock_guard<std::mutex> lock(commands_mutex_);
    return commands_.size();
  }

  std::unique_ptr<BrokerGateway> gateway_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<BrokerClient> client_;
  std::string host_token_;

  std::thread watcher_;
  std::mutex commands_mutex_;
  std::vector<broker::v1::HostCommand> commands_;
};

TEST_F(BrokerGatewayTest, RegisterHostRejectsBadSignature) {
  std::string token;
  EXPECT_EQ(client_->RegisterHost("rack-1", "rack-1:50062", usb_broker::UnixSeconds(),
                                  "00ff", &token),
            BrokerError::kUnauthenticated);
  EXPECT_TRUE(token.empty());
}

TEST_F(BrokerGatewayTest, ReportDeviceRequiresHostToken) {
  std::string device_id;
  EXPECT_EQ(client_->ReportDevice("rack-1", "forged", MakeDescriptor("1-1"),
                                  &device_id),
            BrokerError::kNotFound);
  RegisterRack();
  EXPECT_EQ(client_->ReportDevice("rack-1", "forged", MakeDescriptor("1-2"),
                                  &device_id),
            BrokerError::kUnauthenticated);
}

TEST_F(BrokerGatewayTest, AcquireReturnsSessionAddressAndRenews) {
  const std::string device = RegisterRack();
  LeaseGrant grant;
  ASSERT_EQ(client_->Acquire(device, "alice", 500ms, &grant, nullptr),
            BrokerError::kOk);
  EXPECT_EQ(grant.device_id, device);
  EXPECT_EQ(grant.session_address, "rack-1:50062");
  EXPECT_EQ(grant.ttl, 500ms);

  LeaseGrant renewed;
  EXPECT_EQ(client_->Renew(grant.token, &renewed), BrokerError::kOk);
  EXPECT_EQ(renewed.generation, grant.generation);

  EXPECT_EQ(client_->Acquire(device, "bob", 0ms, nullptr, nullptr), BrokerError::kBusy);
  EXPECT_EQ(client_->Release(grant.token), BrokerError::kOk);
  EXPECT_EQ(client_->Release(grant.token), BrokerError::kInvalidToken);
}

TEST_F(BrokerGatewayTest, RetriedAcquireReplaysFirstAnswer) {
  const std::string device = RegisterRack();
  auto stub = broker::v1::LeaseService::NewStub(channel_);

  broker::v1::AcquireLeaseRequest req;
  req.mutable_base()->set_request_id("retry-1");
  req.set_device_id(device);
  req.set_consumer_id("alice");

  broker::v1::AcquireLeaseResponse first, second;
  {
    grpc::ClientContext ctx;
    ASSERT_TRUE(stub->AcquireLease(&ctx, req, &first).ok());
  }
  {
    grpc::ClientContext ctx;
    ASSERT_TRUE(stub->AcquireLease(&ctx, req, &second).ok());
  }
  EXPECT_EQ(first.base().error_code(), broker::v1::ERROR_CODE_OK);
  EXPECT_EQ(second.base().error_code(), broker::v1::ERROR_CODE_OK);
  EXPECT_EQ(first.lease().lease_token(), second.lease().lease_token());

  // A fresh request id is a new attempt and sees the device busy
  req.mutable_base()->set_request_id("retry-2");
  broker::v1::AcquireLeaseResponse third;
  grpc::ClientContext ctx;
  ASSERT_TRUE(stub->AcquireLease(&ctx, req, &third).ok());
  EXPECT_EQ(third.base().error_code(), broker::v1::ERROR_CODE_BUSY);
}

TEST_F(BrokerGatewayTest, ConcurrentRetriesOfOneAcquireShareTheLease) {
  const std::string device = RegisterRack();
  auto stub = broker::v1::LeaseService::NewStub(channel_);

  broker::v1::AcquireLeaseRequest req;
  req.mutable_base()->set_request_id("retry-concurrent");
  req.set_device_id(device);
  req.set_consumer_id("alice");

  constexpr int kCopies = 8;
  std::vector<broker::v1::AcquireLeaseResponse> responses(kCopies);
  std::vector<std::thread> threads;
  for (int i = 0; i < kCopies; ++i) {
    threads.emplace_back([&, i]() {
      grpc::ClientContext ctx;
      EXPECT_TRUE(stub->AcquireLease(&ctx, req, &responses[i]).ok());
    });
  }
  for (auto &t : threads) t.join();

  for (const auto &r : responses) {
    EXPECT_EQ(r.base().error_code(), broker::v1::ERROR_CODE_OK);
    EXPECT_EQ(r.lease().lease_token(), responses[0].lease().lease_token());
  }
  LeaseGrant grant;
  ASSERT_EQ(client_->Renew(responses[0].lease().lease_token(), &grant),
            BrokerError::kOk);
}

TEST_F(BrokerGatewayTest, LeaseLifecycleDrivesHostCommands) {
  const std::string device = RegisterRack();
  StartWatching();
  // Let the stream subscribe before the first command is produced
  std::this_thread::sleep_for(100ms);

  LeaseGrant grant;
  ASSERT_EQ(client_->Acquire(device, "alice", 0ms, &grant, nullptr), BrokerError::kOk);
  ASSERT_TRUE(WaitUntil([&] { return CommandCount() >= 1; }));

  std::string consumer;
  ASSERT_EQ(client_->RevokeDevice(device, "maintenance", &consumer), BrokerError::kOk);
  EXPECT_EQ(consumer, "alice");

  auto find = [this](broker::v1::HostCommandType type, broker::v1::HostCommand *out) {
    std::lock_guard<std::mutex> lock(commands_mutex_);
    for (const auto &cmd : commands_) {
      if (cmd.type() == type) {
        *out = cmd;
        return true;
      }
    }
    return false;
  };
  broker::v1::HostCommand start, stop;
  ASSERT_TRUE(find(broker::v1::HOST_COMMAND_TYPE_START_SESSION, &start));
  ASSERT_TRUE(WaitUntil(
      [&] { return find(broker::v1::HOST_COMMAND_TYPE_STOP_SESSION, &stop); }));

  EXPECT_EQ(start.lease_token(), grant.token);
  EXPECT_EQ(start.bus_path(), "1-1");
  EXPECT_EQ(start.consumer_id(), "alice");
  EXPECT_EQ(stop.lease_token(), grant.token);
  EXPECT_EQ(stop.reason(), broker::v1::CLOSE_REASON_REVOKED);
}

TEST_F(BrokerGatewayTest, MissedHostHeartbeatsMakeDevicesUnreachable) {
  const std::string device = RegisterRack();
  ASSERT_TRUE(WaitUntil(
      [&] {
        broker::v1::DeviceSummary summary;
        return client_->GetDevice(device, &summary) == BrokerError::kOk &&
               summary.state() == broker::v1::DEVICE_STATE_UNREACHABLE;
      },
      3s));

  uint32_t retry_after = 0;
  EXPECT_EQ(client_->Acquire(device, "alice", 0ms, nullptr, &retry_after),
            BrokerError::kUnreachable);
  EXPECT_EQ(retry_after, 1000u);
  EXPECT_EQ(client_->Heartbeat("rack-1", host_token_, 0, 0),
            BrokerError::kUnauthenticated);
}

TEST_F(BrokerGatewayTest, HeartbeatsKeepHostReachable) {
  const std::string device = RegisterRack();
  for (int i = 0; i < 15; ++i) {
    std::this_thread::sleep_for(100ms);
    ASSERT_EQ(client_->Heartbeat("rack-1", host_token_, 1, 0), BrokerError::kOk);
  }
  broker::v1::DeviceSummary summary;
  ASSERT_EQ(client_->GetDevice(device, &summary), BrokerError::kOk);
  EXPECT_EQ(summary.state(), broker::v1::DEVICE_STATE_FREE);
}

TEST_F(BrokerGatewayTest, RemoveDeviceEndsLeaseWithDeviceRemoved) {
  const std::string device = RegisterRack();
  LeaseGrant grant;
  ASSERT_EQ(client_->Acquire(device, "alice", 0ms, &grant, nullptr), BrokerError::kOk);
  ASSERT_EQ(client_->RemoveDevice("rack-1", host_token_, device, "unplugged"),
            BrokerError::kOk);

  EXPECT_EQ(client_->Renew(grant.token, nullptr), BrokerError::kInvalidToken);
  broker::v1::DeviceSummary summary;
  ASSERT_EQ(client_->GetDevice(device, &summary), BrokerError::kOk);
  EXPECT_EQ(summary.state(), broker::v1::DEVICE_STATE_UNREACHABLE);
}

TEST_F(BrokerGatewayTest, GetDeviceCarriesReportedDescriptor) {
  const std::string device = RegisterRack("2-4");
  broker::v1::DeviceSummary summary;
  ASSERT_EQ(client_->GetDevice(device, &summary), BrokerError::kOk);
  EXPECT_EQ(summary.device_id(), device);
  EXPECT_EQ(summary.device_descriptor().bus_path(), "2-4");
  EXPECT_EQ(summary.device_descriptor().vendor_id(), 0x18d1u);
  EXPECT_EQ(summary.device_descriptor().product_id(), 0x4ee7u);
  EXPECT_EQ(summary.device_descriptor().serial(), "SN-2-4");
}

TEST_F(BrokerGatewayTest, SessionStateEmitsOneEventPerTransition) {
  const std::string device = RegisterRack();
  LeaseGrant grant;
  ASSERT_EQ(client_->Acquire(device, "alice", 0ms, &grant, nullptr), BrokerError::kOk);
  ASSERT_EQ(client_->ReportSessionState("rack-1", host_token_, device, grant.token,
                                        true, broker::v1::CLOSE_REASON_UNSPECIFIED),
            BrokerError::kOk);
  ASSERT_EQ(client_->ReportSessionState("rack-1", host_token_, device, grant.token,
                                        false, broker::v1::CLOSE_REASON_RELEASED),
            BrokerError::kOk);

  broker::v1::EventStreamRequest req;
  req.add_filter_types(broker::v1::EVENT_TYPE_SESSION_STARTED);
  req.add_filter_types(broker::v1::EVENT_TYPE_SESSION_ENDED);
  std::vector<broker::v1::Event> seen;
  ASSERT_EQ(client_->StreamEvents(
                req,
                [&](const broker::v1::Event &ev) {
                  seen.push_back(ev);
                  return true;
                },
                1000ms),
            BrokerError::kOk);
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0].type(), broker::v1::EVENT_TYPE_SESSION_STARTED);
  EXPECT_EQ(seen[1].type(), broker::v1::EVENT_TYPE_SESSION_ENDED);
  EXPECT_EQ(seen[1].description(), "CLOSE_REASON_RELEASED");
}

TEST_F(BrokerGatewayTest, AdminRevokeOnFreeDeviceIsAlreadyFree) {
  const std::string device = RegisterRack();
  std::string message;
  EXPECT_EQ(client_->RevokeDevice(device, "", nullptr, &message),
            BrokerError::kAlreadyFree);
  EXPECT_EQ(client_->RevokeDevice("rack-1:9-9", "", nullptr, nullptr),
            BrokerError::kNotFound);
}

TEST_F(BrokerGatewayTest, ListDevicesFiltersByState) {
  const std::string a = RegisterRack("1-1");
  std::string b;
  ASSERT_EQ(client_->ReportDevice("rack-1", host_token_, MakeDescriptor("1-2"), &b),
            BrokerError::kOk);
  ASSERT_EQ(client_->Acquire(a, "alice", 0ms, nullptr, nullptr), BrokerError::kOk);

  broker::v1::ListDevicesRequest filter;
  std::vector<broker::v1::DeviceSummary> devices;
  ASSERT_EQ(client_->ListDevices(filter, &devices), BrokerError::kOk);
  EXPECT_EQ(devices.size(), 2u);

  filter.set_state(broker::v1::DEVICE_STATE_LEASED);
  ASSERT_EQ(client_->ListDevices(filter, &devices), BrokerError::kOk);
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].device_id(), a);
  EXPECT_EQ(devices[0].lease_consumer(), "alice");
}

TEST_F(BrokerGatewayTest, StreamEventsReplaysAndFilters) {
  const std::string device = RegisterRack();
  LeaseGrant grant;
  ASSERT_EQ(client_->Acquire(device, "alice", 0ms, &grant, nullptr), BrokerError::kOk);
  ASSERT_EQ(client_->Release(grant.token), BrokerError::kOk);

  broker::v1::EventStreamRequest req;
  req.add_filter_types(broker::v1::EVENT_TYPE_LEASE_GRANTED);
  req.add_filter_types(broker::v1::EVENT_TYPE_LEASE_RELEASED);
  std::vector<broker::v1::EventType> seen;
  ASSERT_EQ(client_->StreamEvents(
                req,
                [&](const broker::v1::Event &ev) {
                  seen.push_back(ev.type());
                  return true;
                },
                1000ms),
            BrokerError::kOk);
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], broker::v1::EVENT_TYPE_LEASE_GRANTED);
  EXPECT_EQ(seen[1], broker::v1::EVENT_TYPE_LEASE_RELEASED);
}

TEST_F(BrokerGatewayTest, WaitForAvailabilityWakesOnRelease) {
  const std::string device = RegisterRack();
  LeaseGrant grant;
  ASSERT_EQ(client_->Acquire(device, "alice", 0ms, &grant, nullptr), BrokerError::kOk);

  std::thread releaser([&]() {
    std::this_thread::sleep_for(150ms);
    client_->Release(grant.token);
  });
  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(client_->WaitForAvailability(device, 2000ms));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1500ms);
  releaser.join();
}

// ── Purge after grace ──

class BrokerGatewayPurgeTest : public BrokerGatewayTest {
protected:
  BrokerConfig MakeConfig() const override {
    BrokerConfig cfg = TestBrokerConfig();
    cfg.purge_grace_ms = 100;
    return cfg;
  }
};

TEST_F(BrokerGatewayPurgeTest, RemovedDeviceIsPurgedAfterGrace) {
  const std::string device = RegisterRack();
  ASSERT_EQ(client_->RemoveDevice("rack-1", host_token_, device, "unplugged"),
            BrokerError::kOk);

  broker::v1::DeviceSummary summary;
  ASSERT_EQ(client_->GetDevice(device, &summary), BrokerError::kOk);
  EXPECT_EQ(summary.state(), broker::v1::DEVICE_STATE_UNREACHABLE);

  EXPECT_TRUE(WaitUntil(
      [&]() { return client_->GetDevice(device, nullptr) == BrokerError::kNotFound; },
      2000ms));
  std::vector<broker::v1::DeviceSummary> devices;
  ASSERT_EQ(client_->ListDevices(broker::v1::ListDevicesRequest(), &devices),
            BrokerError::kOk);
  EXPECT_TRUE(devices.empty());
}

TEST_F(BrokerGatewayPurgeTest, DeviceReportedAgainAfterPurgeStartsFresh) {
  const std::string device = RegisterRack();
  ASSERT_EQ(client_->RemoveDevice("rack-1", host_token_, device, "unplugged"),
            BrokerError::kOk);
  ASSERT_TRUE(WaitUntil(
      [&]() { return client_->GetDevice(device, nullptr) == BrokerError::kNotFound; },
      2000ms));

  std::string again;
  ASSERT_EQ(client_->ReportDevice("rack-1", host_token_, MakeDescriptor("1-1"), &again),
            BrokerError::kOk);
  EXPECT_EQ(again, device);
  broker::v1::DeviceSummary summary;
  ASSERT_EQ(client_->GetDevice(device, &summary), BrokerError::kOk);
  EXPECT_EQ(summary.state(), broker::v1::DEVICE_STATE_FREE);
}
