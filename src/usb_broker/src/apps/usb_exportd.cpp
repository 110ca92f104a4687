// usb_exportd: Export Agent
// 运行在物理持有 USB 设备的机器上: 注册到 broker, 托管 SessionService
// 端口: 50062 (默认)

#include "usb_broker/agent/broker_client.hpp"
#include "usb_broker/agent/export_agent.hpp"
#include "usb_broker/agent/linux_usbfs_backend.hpp"
#include "usb_broker/agent/simulated_backend.hpp"
#include "usb_broker/common/config.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"
#include "usb_broker/services/server_credentials.hpp"
#include "usb_broker/services/session_service.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

static volatile std::sig_atomic_t g_signal = 0;

static void SignalHandler(int sig) { g_signal = sig; }

static void PrintBanner(const usb_broker::ExportAgentConfig &config) {
  usb_broker::LogInfo("========================================");
  usb_broker::LogInfo("  USB Export Agent v%s", USB_BROKER_VERSION);
  usb_broker::LogInfo("  Host:     %s", config.host_id.c_str());
  usb_broker::LogInfo("  Broker:   %s", config.broker_address.c_str());
  usb_broker::LogInfo("  Session:  %s:%d (advertised %s)", config.bind_address.c_str(),
                      config.session_port, config.advertise_address.c_str());
  usb_broker::LogInfo("  Backend:  %s", config.backend.c_str());
  usb_broker::LogInfo("  Filters:  %zu", config.device_filters.size());
  usb_broker::LogInfo("  TLS:      %s", config.tls_cert_path.empty() ? "off" : "on");
  usb_broker::LogInfo("========================================");
}

int main(int argc, char *argv[]) {
  // 解析命令行
  std::string config_path = "/etc/usb_broker/export_agent.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      fprintf(stdout,
              "Usage: usb_exportd [--config <path>]\n"
              "\n"
              "Options:\n"
              "  --config, -c  Path to YAML config file\n"
              "                Default: /etc/usb_broker/export_agent.yaml\n"
              "  --help, -h    Show this help\n");
      return 0;
    }
  }

  usb_broker::SetLogTag("usb_exportd");

  // 加载配置
  usb_broker::ExportAgentConfig config;
  if (usb_broker::FileExists(config_path)) {
    config = usb_broker::LoadExportAgentConfig(config_path);
    usb_broker::LogInfo("Loaded config from %s", config_path.c_str());
  } else {
    usb_broker::LogWarn("Config not found at %s, using defaults", config_path.c_str());
    config.host_id = usb_broker::GetHostname();
    config.advertise_address =
        config.host_id + ":" + std::to_string(config.session_port);
  }
  usb_broker::SetLogLevel(usb_broker::ParseLogLevel(config.log_level));

  if (!usb_broker::IsValidHostId(config.host_id)) {
    usb_broker::LogError("Invalid host_id '%s' (allowed: [A-Za-z0-9._-])",
                         config.host_id.c_str());
    return 1;
  }

  PrintBanner(config);

  // 信号处理
  signal(SIGINT, SignalHandler);
  signal(SIGTERM, SignalHandler);

  std::shared_ptr<usb_broker::agent::DeviceBackend> backend;
  if (config.backend == "simulated") {
    backend = std::make_shared<usb_broker::agent::SimulatedDeviceBackend>(
        config.simulated_devices);
  } else if (config.backend == "linux") {
    backend = std::make_shared<usb_broker::agent::LinuxUsbfsBackend>();
  } else {
    usb_broker::LogError("Unknown backend '%s'", config.backend.c_str());
    return 1;
  }

  auto client = std::make_shared<usb_broker::agent::BrokerClient>(
      usb_broker::agent::BrokerClient::MakeChannel(config.broker_address,
                                                   config.tls_root_cert_path),
      std::chrono::milliseconds(config.rpc_timeout_ms));
  auto agent =
      std::make_shared<usb_broker::agent::ExportAgent>(config, backend, client);
  usb_broker::services::SessionServiceImpl session_service(agent);

  // 构建 gRPC Server
  const std::string listen_addr =
      config.bind_address + ":" + std::to_string(config.session_port);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(listen_addr,
                           usb_broker::services::MakeServerCredentials(
                               config.tls_cert_path, config.tls_key_path));
  builder.RegisterService(&session_service);
  // bulk 传输的单帧上限
  builder.SetMaxReceiveMessageSize(16 * 1024 * 1024);
  builder.SetMaxSendMessageSize(16 * 1024 * 1024);

  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    usb_broker::LogError("Failed to start gRPC server on %s", listen_addr.c_str());
    return 1;
  }
  usb_broker::LogInfo("Export Agent listening on %s", listen_addr.c_str());

  agent->Start();

  while (g_signal == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  usb_broker::LogInfo("Received signal %d, shutting down...", static_cast<int>(g_signal));

  // 先拆会话 (释放 claim), 再停 server
  agent->Stop();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));

  usb_broker::LogInfo("Export Agent shutdown complete");
  return 0;
}
