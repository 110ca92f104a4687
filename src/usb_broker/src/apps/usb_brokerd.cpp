// usb_brokerd: USB 设备共享 broker
// Device Registry + Lease Coordinator + Host Agent 表, 纯 gRPC
// 端口: 50061 (默认)

#include "usb_broker/broker_gateway.hpp"
#include "usb_broker/common/config.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

static volatile std::sig_atomic_t g_signal = 0;

static void SignalHandler(int sig) { g_signal = sig; }

static void PrintBanner(const usb_broker::BrokerConfig &config) {
  usb_broker::LogInfo("========================================");
  usb_broker::LogInfo("  USB Broker v%s", USB_BROKER_VERSION);
  usb_broker::LogInfo("  Listen:   %s:%d", config.bind_address.c_str(), config.grpc_port);
  usb_broker::LogInfo("  Hostname: %s", usb_broker::GetHostname().c_str());
  usb_broker::LogInfo("  TLS:      %s", config.tls_cert_path.empty() ? "off" : "on");
  usb_broker::LogInfo("  Lease:    ttl %ums [%u, %u]", config.lease.default_ttl_ms,
                      config.lease.min_ttl_ms, config.lease.max_ttl_ms);
  usb_broker::LogInfo("  Hosts:    %zu credential(s)%s", config.host_credentials.size(),
                      config.host_credentials.empty() ? " (open registration)" : "");
  usb_broker::LogInfo("========================================");
}

int main(int argc, char *argv[]) {
  // 解析命令行
  std::string config_path = "/etc/usb_broker/broker.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      fprintf(stdout,
              "Usage: usb_brokerd [--config <path>]\n"
              "\n"
              "Options:\n"
              "  --config, -c  Path to YAML config file\n"
              "                Default: /etc/usb_broker/broker.yaml\n"
              "  --help, -h    Show this help\n");
      return 0;
    }
  }

  usb_broker::SetLogTag("usb_brokerd");

  // 加载配置
  usb_broker::BrokerConfig config;
  if (usb_broker::FileExists(config_path)) {
    config = usb_broker::LoadBrokerConfig(config_path);
    usb_broker::LogInfo("Loaded config from %s", config_path.c_str());
  } else {
    usb_broker::LogWarn("Config not found at %s, using defaults", config_path.c_str());
  }
  usb_broker::SetLogLevel(usb_broker::ParseLogLevel(config.log_level));

  PrintBanner(config);

  // 信号处理
  signal(SIGINT, SignalHandler);
  signal(SIGTERM, SignalHandler);

  usb_broker::BrokerGateway gateway(config);
  if (!gateway.Start()) {
    return 1;
  }

  while (g_signal == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  usb_broker::LogInfo("Received signal %d, shutting down...", static_cast<int>(g_signal));
  gateway.Stop();

  usb_broker::LogInfo("USB Broker shutdown complete");
  return 0;
}
