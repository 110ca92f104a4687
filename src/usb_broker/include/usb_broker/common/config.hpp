#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace usb_broker {

// ──────────────── Broker ────────────────

struct LeaseOptions {
  uint32_t default_ttl_ms = 30000;
  uint32_t min_ttl_ms = 1000;
  uint32_t max_ttl_ms = 600000;
  uint32_t unbind_timeout_ms = 5000;  // Bound → Free 兜底超时
};

struct BrokerConfig {
  int grpc_port = 50061;
  std::string bind_address = "0.0.0.0";

  std::string tls_cert_path;
  std::string tls_key_path;
  std::string log_level = "INFO";

  LeaseOptions lease;
  uint32_t sweep_interval_ms = 500;
  uint32_t host_heartbeat_timeout_ms = 15000;
  uint32_t purge_grace_ms = 60000;
  int auth_max_skew_sec = 300;

  // host_id → 共享密钥; 为空时允许任意 Host Agent 注册
  std::unordered_map<std::string, std::string> host_credentials;

  size_t event_buffer_size = 1000;
  std::string event_log_path;
  size_t event_log_max_bytes = 10 * 1024 * 1024;
  int idempotency_ttl_sec = 600;
};

BrokerConfig LoadBrokerConfig(const std::string &yaml_path);

// ──────────────── Export Agent ────────────────

// 0 / -1 = 通配
struct DeviceFilter {
  uint32_t vendor_id = 0;
  uint32_t product_id = 0;
  int device_class = -1;
};

struct SimulatedDeviceSpec {
  std::string bus_path;
  uint32_t vendor_id = 0x18d1;   // Google
  uint32_t product_id = 0x4ee7;
  uint32_t device_class = 0;
  std::string serial;
  std::string manufacturer = "Simulated";
  std::string product = "Simulated Device";
  std::string speed = "high";
};

struct ExportAgentConfig {
  std::string host_id;
  std::string broker_address = "127.0.0.1:50061";

  // SessionService 监听 / 对外公布地址
  std::string bind_address = "0.0.0.0";
  int session_port = 50062;
  std::string advertise_address;  // 为空时 = hostname:session_port

  std::string credential;
  std::string credential_path;

  std::string tls_cert_path;
  std::string tls_key_path;
  std::string tls_root_cert_path;  // 连接 broker 时校验
  std::string log_level = "INFO";

  std::string backend = "linux";  // "linux" | "simulated"
  std::vector<SimulatedDeviceSpec> simulated_devices;
  std::vector<DeviceFilter> device_filters;

  uint32_t heartbeat_interval_ms = 1000;
  uint32_t missed_heartbeat_limit = 3;
  uint32_t host_heartbeat_interval_ms = 5000;
  uint32_t rpc_timeout_ms = 3000;
  uint32_t session_authorize_wait_ms = 2000;
  uint32_t default_transfer_timeout_ms = 5000;
};

ExportAgentConfig LoadExportAgentConfig(const std::string &yaml_path);

// ──────────────── Import Agent ────────────────

struct AttachRetryOptions {
  int max_attempts = 1;  // 1 = 不重试
  uint32_t initial_backoff_ms = 500;
  uint32_t max_backoff_ms = 8000;
};

struct ImportAgentConfig {
  std::string consumer_id;  // 为空时 = hostname
  std::string broker_address = "127.0.0.1:50061";
  std::string tls_root_cert_path;
  std::string log_level = "INFO";

  uint32_t lease_ttl_ms = 30000;
  uint32_t renew_interval_ms = 0;  // 0 = ttl / 3
  uint32_t rpc_timeout_ms = 3000;
  uint32_t session_open_timeout_ms = 5000;
  uint32_t default_transfer_timeout_ms = 5000;
  AttachRetryOptions attach_retry;

  std::string listen_address = "unix:///run/usb_broker/import.sock";
};

ImportAgentConfig LoadImportAgentConfig(const std::string &yaml_path);

} // namespace usb_broker
