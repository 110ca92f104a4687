#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <unistd.h>

#include "usb_broker/common/config.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"

class ConfigTest : public ::testing::Test {
protected:
  std::string Write(const std::string &name, const std::string &content) {
    const std::string path = ::testing::TempDir() + name + "_" +
                             std::to_string(::getpid()) + ".yaml";
    std::ofstream out(path);
    out << content;
    paths_.push_back(path);
    return path;
  }

  void TearDown() override {
    for (const auto &p : paths_) std::remove(p.c_str());
  }

  std::vector<std::string> paths_;
};

TEST_F(ConfigTest, BrokerConfigParsesNestedLeaseAndCredentials) {
  auto path = Write("broker", R"(
grpc_port: 6000
log_level: DEBUG
sweep_interval_ms: 250
host_heartbeat_timeout_ms: 9000
lease:
  default_ttl_ms: 20000
  min_ttl_ms: 2000
  max_ttl_ms: 60000
  unbind_timeout_ms: 3000
host_credentials:
  rack-1: alpha
  rack-2: beta
event_log_path: /tmp/events.jsonl
)");
  auto cfg = usb_broker::LoadBrokerConfig(path);
  EXPECT_EQ(cfg.grpc_port, 6000);
  EXPECT_EQ(cfg.log_level, "DEBUG");
  EXPECT_EQ(cfg.sweep_interval_ms, 250u);
  EXPECT_EQ(cfg.host_heartbeat_timeout_ms, 9000u);
  EXPECT_EQ(cfg.lease.default_ttl_ms, 20000u);
  EXPECT_EQ(cfg.lease.min_ttl_ms, 2000u);
  EXPECT_EQ(cfg.lease.max_ttl_ms, 60000u);
  EXPECT_EQ(cfg.lease.unbind_timeout_ms, 3000u);
  ASSERT_EQ(cfg.host_credentials.size(), 2u);
  EXPECT_EQ(cfg.host_credentials.at("rack-2"), "beta");
  EXPECT_EQ(cfg.event_log_path, "/tmp/events.jsonl");
}

TEST_F(ConfigTest, BrokerConfigSwapsInvertedTtlBounds) {
  auto path = Write("broker_inverted", "lease:\n  min_ttl_ms: 9000\n  max_ttl_ms: 100\n");
  auto cfg = usb_broker::LoadBrokerConfig(path);
  EXPECT_EQ(cfg.lease.min_ttl_ms, 100u);
  EXPECT_EQ(cfg.lease.max_ttl_ms, 9000u);
}

TEST_F(ConfigTest, MalformedYamlFallsBackToDefaults) {
  auto path = Write("broker_bad", "grpc_port: [unterminated\n");
  auto cfg = usb_broker::LoadBrokerConfig(path);
  EXPECT_EQ(cfg.grpc_port, usb_broker::BrokerConfig{}.grpc_port);
}

TEST_F(ConfigTest, ExportAgentConfigReadsFiltersAndSimulatedDevices) {
  auto path = Write("export", R"(
host_id: rack-7
session_port: 7000
backend: simulated
device_filters:
  - vendor_id: 0x18d1
  - device_class: 255
simulated_devices:
  - bus_path: "1-1"
    vendor_id: 0x1234
    product_id: 0x5678
    serial: SIM1
  - bus_path: "1-2"
)");
  auto cfg = usb_broker::LoadExportAgentConfig(path);
  EXPECT_EQ(cfg.host_id, "rack-7");
  EXPECT_EQ(cfg.backend, "simulated");
  ASSERT_EQ(cfg.device_filters.size(), 2u);
  EXPECT_EQ(cfg.device_filters[0].vendor_id, 0x18d1u);
  EXPECT_EQ(cfg.device_filters[1].device_class, 255);
  ASSERT_EQ(cfg.simulated_devices.size(), 2u);
  EXPECT_EQ(cfg.simulated_devices[0].product_id, 0x5678u);
  EXPECT_EQ(cfg.simulated_devices[0].serial, "SIM1");
  EXPECT_EQ(cfg.simulated_devices[1].bus_path, "1-2");
  // advertise_address defaults to hostname:session_port
  EXPECT_EQ(cfg.advertise_address, usb_broker::GetHostname() + ":7000");
}

TEST_F(ConfigTest, CredentialFileOverridesInlineSecret) {
  auto secret = Write("secret", "  from-file\n");
  auto path = Write("export_secret",
                    "host_id: rack-1\ncredential: inline\ncredential_path: " +
                        secret + "\n");
  auto cfg = usb_broker::LoadExportAgentConfig(path);
  EXPECT_EQ(cfg.credential, "from-file");
}

TEST_F(ConfigTest, ImportAgentConfigDerivesRenewInterval) {
  auto path = Write("import", R"(
consumer_id: ci-7
lease_ttl_ms: 9000
attach_retry:
  max_attempts: 4
  initial_backoff_ms: 100
)");
  auto cfg = usb_broker::LoadImportAgentConfig(path);
  EXPECT_EQ(cfg.consumer_id, "ci-7");
  EXPECT_EQ(cfg.lease_ttl_ms, 9000u);
  EXPECT_EQ(cfg.renew_interval_ms, 3000u);
  EXPECT_EQ(cfg.attach_retry.max_attempts, 4);
  EXPECT_EQ(cfg.attach_retry.initial_backoff_ms, 100u);
  EXPECT_EQ(cfg.attach_retry.max_backoff_ms, 8000u);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
  using usb_broker::LogLevel;
  EXPECT_EQ(usb_broker::ParseLogLevel("DEBUG"), LogLevel::kDebug);
  EXPECT_EQ(usb_broker::ParseLogLevel("warn"), LogLevel::kWarn);
  EXPECT_EQ(usb_broker::ParseLogLevel("ERROR"), LogLevel::kError);
  EXPECT_EQ(usb_broker::ParseLogLevel("bogus"), LogLevel::kInfo);
}
