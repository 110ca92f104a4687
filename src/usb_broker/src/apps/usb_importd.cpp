// usb_importd: Import Agent
// 运行在消费者容器内: 租用远端设备并以本地虚拟设备的形式提供
// 监听: unix:///run/usb_broker/import.sock (默认)

#include "usb_broker/agent/broker_client.hpp"
#include "usb_broker/agent/import_agent.hpp"
#include "usb_broker/agent/virtual_device.hpp"
#include "usb_broker/common/config.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"
#include "usb_broker/core/idempotency_cache.hpp"
#include "usb_broker/services/import_service.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

static volatile std::sig_atomic_t g_signal = 0;

static void SignalHandler(int sig) { g_signal = sig; }

static void PrintBanner(const usb_broker::ImportAgentConfig &config) {
  usb_broker::LogInfo("========================================");
  usb_broker::LogInfo("  USB Import Agent v%s", USB_BROKER_VERSION);
  usb_broker::LogInfo("  Consumer: %s", config.consumer_id.c_str());
  usb_broker::LogInfo("  Broker:   %s", config.broker_address.c_str());
  usb_broker::LogInfo("  Listen:   %s", config.listen_address.c_str());
  usb_broker::LogInfo("  Lease:    ttl %ums, renew every %ums", config.lease_ttl_ms,
                      config.renew_interval_ms ? config.renew_interval_ms
                                               : config.lease_ttl_ms / 3);
  usb_broker::LogInfo("========================================");
}

int main(int argc, char *argv[]) {
  // 解析命令行
  std::string config_path = "/etc/usb_broker/import_agent.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      fprintf(stdout,
              "Usage: usb_importd [--config <path>]\n"
              "\n"
              "Options:\n"
              "  --config, -c  Path to YAML config file\n"
              "                Default: /etc/usb_broker/import_agent.yaml\n"
              "  --help, -h    Show this help\n");
      return 0;
    }
  }

  usb_broker::SetLogTag("usb_importd");

  // 加载配置
  usb_broker::ImportAgentConfig config;
  if (usb_broker::FileExists(config_path)) {
    config = usb_broker::LoadImportAgentConfig(config_path);
    usb_broker::LogInfo("Loaded config from %s", config_path.c_str());
  } else {
    usb_broker::LogWarn("Config not found at %s, using defaults", config_path.c_str());
    config.consumer_id = usb_broker::GetHostname();
  }
  usb_broker::SetLogLevel(usb_broker::ParseLogLevel(config.log_level));

  PrintBanner(config);

  // 信号处理
  signal(SIGINT, SignalHandler);
  signal(SIGTERM, SignalHandler);

  auto client = std::make_shared<usb_broker::agent::BrokerClient>(
      usb_broker::agent::BrokerClient::MakeChannel(config.broker_address,
                                                   config.tls_root_cert_path),
      std::chrono::milliseconds(config.rpc_timeout_ms));
  auto connector = std::make_shared<usb_broker::agent::GrpcSessionConnector>(
      config.tls_root_cert_path);
  auto table = std::make_shared<usb_broker::agent::LocalDeviceTable>();
  auto agent = std::make_shared<usb_broker::agent::ImportAgent>(config, client,
                                                                connector, table);
  agent->SetFaultCallback([](const std::string &handle,
                             usb_broker::agent::FaultKind kind,
                             usb_broker::BrokerError error) {
    usb_broker::LogError("Device %s lost: %s (%s), detach required", handle.c_str(),
                         usb_broker::agent::FaultKindName(kind),
                         usb_broker::ToString(error));
  });

  usb_broker::services::ImportServiceImpl import_service(
      agent, table, std::make_shared<usb_broker::core::IdempotencyCache>());

  // 本地接口, 不启用 TLS
  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&import_service);
  builder.SetMaxReceiveMessageSize(16 * 1024 * 1024);
  builder.SetMaxSendMessageSize(16 * 1024 * 1024);

  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    usb_broker::LogError("Failed to start gRPC server on %s",
                         config.listen_address.c_str());
    return 1;
  }
  usb_broker::LogInfo("Import Agent listening on %s", config.listen_address.c_str());

  agent->Start();

  while (g_signal == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  usb_broker::LogInfo("Received signal %d, shutting down...", static_cast<int>(g_signal));

  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  // 释放全部租约
  agent->Stop();

  usb_broker::LogInfo("Import Agent shutdown complete");
  return 0;
}
