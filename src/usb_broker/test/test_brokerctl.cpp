#include <gtest/gtest.h>
#include <sstream>

#include "test_helpers.hpp"
#include "usb_broker/agent/broker_client.hpp"
#include "usb_broker/broker_gateway.hpp"
#include "usb_broker/cli/brokerctl.hpp"
#include "usb_broker/common/utils.hpp"

using namespace std::chrono_literals;
using usb_broker::BrokerConfig;
using usb_broker::BrokerError;
using usb_broker::BrokerGateway;
using usb_broker::agent::BrokerClient;
using usb_broker::agent::LeaseGrant;
using usb_broker::testing_util::MakeDescriptor;
namespace cli = usb_broker::cli;

// ── Argument parsing ──

TEST(BrokerctlArgsTest, ExitCodes) {
  EXPECT_EQ(cli::ExitCodeFor(BrokerError::kOk), 0);
  EXPECT_EQ(cli::ExitCodeFor(BrokerError::kNotFound), 2);
  EXPECT_EQ(cli::ExitCodeFor(BrokerError::kAlreadyFree), 3);
  EXPECT_EQ(cli::ExitCodeFor(BrokerError::kUnreachable), 4);
  EXPECT_EQ(cli::ExitCodeFor(BrokerError::kBusy), 5);
  EXPECT_EQ(cli::ExitCodeFor(BrokerError::kInternal), 5);
  EXPECT_EQ(cli::ExitCodeFor(BrokerError::kInvalidArgument), 64);
}

TEST(BrokerctlArgsTest, GlobalOptionsBeforeCommand) {
  cli::CliOptions options;
  std::string error;
  ASSERT_TRUE(cli::ParseArgs({"--broker", "broker:7000", "--timeout-ms", "250",
                              "device", "get", "rack-1:1-1"},
                             &options, &error));
  EXPECT_EQ(options.broker_address, "broker:7000");
  EXPECT_EQ(options.timeout_ms, 250u);
  ASSERT_EQ(options.command.size(), 3u);
  EXPECT_EQ(options.command[0], "device");
  EXPECT_EQ(options.command[2], "rack-1:1-1");
}

TEST(BrokerctlArgsTest, RejectsBadArguments) {
  cli::CliOptions options;
  std::string error;
  EXPECT_FALSE(cli::ParseArgs({}, &options, &error));
  EXPECT_EQ(error, "missing command");
  EXPECT_FALSE(cli::ParseArgs({"--bogus", "device", "list"}, &options, &error));
  EXPECT_FALSE(cli::ParseArgs({"--timeout-ms", "abc", "events"}, &options, &error));
  EXPECT_FALSE(cli::ParseArgs({"--timeout-ms", "0", "events"}, &options, &error));
  EXPECT_FALSE(cli::ParseArgs({"--broker"}, &options, &error));
}

TEST(BrokerctlArgsTest, UsageMentionsEveryCommand) {
  std::ostringstream out;
  cli::PrintUsage(out);
  const std::string text = out.str();
  EXPECT_NE(text.find("device list"), std::string::npos);
  EXPECT_NE(text.find("device get"), std::string::npos);
  EXPECT_NE(text.find("device revoke"), std::string::npos);
  EXPECT_NE(text.find("events"), std::string::npos);
}

// ── Commands against an in-process broker ──

class BrokerctlTest : public ::testing::Test {
protected:
  void SetUp() override {
    BrokerConfig cfg;
    cfg.sweep_interval_ms = 20;
    cfg.lease.min_ttl_ms = 50;
    cfg.host_credentials = {{"rack-1", "s3cret"}};
    gateway_ = std::make_unique<BrokerGateway>(cfg);
    ASSERT_TRUE(gateway_->Start(false));
    client_ = std::make_unique<BrokerClient>(gateway_->InProcessChannel(), 2000ms);

    const int64_t ts = usb_broker::UnixSeconds();
    const std::string address = "rack-1:50062";
    const std::string sig = usb_broker::ComputeHmacSha256Hex(
        "s3cret", usb_broker::HostSignaturePayload("rack-1", address, ts));
    ASSERT_EQ(client_->RegisterHost("rack-1", address, ts, sig, &host_token_),
              BrokerError::kOk);
    ASSERT_EQ(client_->ReportDevice("rack-1", host_token_,
                                    MakeDescriptor("1-1", 0x0483, 0x374b), &device_),
              BrokerError::kOk);
    std::string second;
    ASSERT_EQ(client_->ReportDevice("rack-1", host_token_, MakeDescriptor("1-2"),
                                    &second),
              BrokerError::kOk);
  }

  void TearDown() override { gateway_->Stop(); }

  int Run(const std::vector<std::string> &command) {
    out_.str("");
    err_.str("");
    cli::CliOptions options;
    options.timeout_ms = 500;
    options.command = command;
    return cli::RunCommand(*client_, options, out_, err_);
  }

  void Lease(const std::string &consumer) {
    LeaseGrant grant;
    ASSERT_EQ(client_->Acquire(device_, consumer, 5000ms, &grant, nullptr),
              BrokerError::kOk);
  }

  std::unique_ptr<BrokerGateway> gateway_;
  std::unique_ptr<BrokerClient> client_;
  std::string host_token_;
  std::string device_;
  std::ostringstream out_;
  std::ostringstream err_;
};

TEST_F(BrokerctlTest, DeviceListShowsEveryDevice) {
  Lease("alice");
  ASSERT_EQ(Run({"device", "list"}), cli::kExitOk);
  const std::string text = out_.str();
  EXPECT_NE(text.find("rack-1:1-1  rack-1  0483:374b  leased  consumer=alice"),
            std::string::npos);
  EXPECT_NE(text.find("rack-1:1-2  rack-1  18d1:4ee7  free"), std::string::npos);
}

TEST_F(BrokerctlTest, DeviceListFilters) {
  Lease("alice");
  ASSERT_EQ(Run({"device", "list", "--state=free"}), cli::kExitOk);
  EXPECT_EQ(out_.str().find("rack-1:1-1"), std::string::npos);
  EXPECT_NE(out_.str().find("rack-1:1-2"), std::string::npos);

  ASSERT_EQ(Run({"device", "list", "--host=rack-9"}), cli::kExitOk);
  EXPECT_TRUE(out_.str().empty());

  EXPECT_EQ(Run({"device", "list", "--state=gone"}), cli::kExitUsage);
  EXPECT_NE(err_.str().find("unknown state"), std::string::npos);
}

TEST_F(BrokerctlTest, DeviceGetPrintsDetail) {
  Lease("alice");
  ASSERT_EQ(Run({"device", "get", device_}), cli::kExitOk);
  const std::string text = out_.str();
  EXPECT_NE(text.find("bus_path:     1-1"), std::string::npos);
  EXPECT_NE(text.find("state:        leased"), std::string::npos);
  EXPECT_NE(text.find("consumer:     alice"), std::string::npos);
}

TEST_F(BrokerctlTest, DeviceGetUnknownIsNotFound) {
  EXPECT_EQ(Run({"device", "get", "rack-1:9-9"}), cli::kExitNotFound);
  EXPECT_NE(err_.str().find("error: "), std::string::npos);
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(BrokerctlTest, RevokeReportsConsumer) {
  Lease("alice");
  ASSERT_EQ(Run({"device", "revoke", device_, "--reason=stuck"}), cli::kExitOk);
  EXPECT_EQ(out_.str(), "revoked " + device_ + " (consumer alice)\n");

  broker::v1::DeviceSummary summary;
  ASSERT_EQ(client_->GetDevice(device_, &summary), BrokerError::kOk);
  EXPECT_NE(summary.state(), broker::v1::DEVICE_STATE_LEASED);
}

TEST_F(BrokerctlTest, RevokeFreeDeviceIsAlreadyFree) {
  EXPECT_EQ(Run({"device", "revoke", "rack-1:1-2", "--reason=x"}),
            cli::kExitAlreadyFree);
  EXPECT_EQ(Run({"device", "revoke", "rack-1:7-7"}), cli::kExitNotFound);
}

TEST_F(BrokerctlTest, UsageErrors) {
  EXPECT_EQ(Run({"device"}), cli::kExitUsage);
  EXPECT_EQ(Run({"device", "frobnicate"}), cli::kExitUsage);
  EXPECT_EQ(Run({"device", "get"}), cli::kExitUsage);
  EXPECT_EQ(Run({"device", "revoke"}), cli::kExitUsage);
  EXPECT_EQ(Run({"lease", "list"}), cli::kExitUsage);
  EXPECT_NE(err_.str().find("usage error"), std::string::npos);
}

TEST_F(BrokerctlTest, EventsReplaysHistory) {
  Lease("alice");
  ASSERT_EQ(Run({"events", "--device=" + device_}), cli::kExitOk);
  const std::string text = out_.str();
  EXPECT_NE(text.find("EVENT_TYPE_LEASE_GRANTED"), std::string::npos);
  EXPECT_EQ(text.find("rack-1:1-2"), std::string::npos);
}
