// config.cpp: 三个守护进程的 YAML 配置加载

#include "usb_broker/common/config.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"

#include <utility>

#include <yaml-cpp/yaml.h>

namespace usb_broker {

namespace {

template <typename T>
void ReadIf(const YAML::Node &node, const char *key, T *out) {
  if (node[key]) *out = node[key].as<T>();
}

DeviceFilter ParseFilter(const YAML::Node &node) {
  DeviceFilter f;
  ReadIf(node, "vendor_id", &f.vendor_id);
  ReadIf(node, "product_id", &f.product_id);
  ReadIf(node, "device_class", &f.device_class);
  return f;
}

SimulatedDeviceSpec ParseSimulatedDevice(const YAML::Node &node) {
  SimulatedDeviceSpec d;
  ReadIf(node, "bus_path", &d.bus_path);
  ReadIf(node, "vendor_id", &d.vendor_id);
  ReadIf(node, "product_id", &d.product_id);
  ReadIf(node, "device_class", &d.device_class);
  ReadIf(node, "serial", &d.serial);
  ReadIf(node, "manufacturer", &d.manufacturer);
  ReadIf(node, "product", &d.product);
  ReadIf(node, "speed", &d.speed);
  return d;
}

} // namespace

// ──────────────── Broker ────────────────

BrokerConfig LoadBrokerConfig(const std::string &yaml_path) {
  BrokerConfig cfg;
  try {
    YAML::Node root = YAML::LoadFile(yaml_path);

    ReadIf(root, "grpc_port", &cfg.grpc_port);
    ReadIf(root, "bind_address", &cfg.bind_address);
    ReadIf(root, "tls_cert_path", &cfg.tls_cert_path);
    ReadIf(root, "tls_key_path", &cfg.tls_key_path);
    ReadIf(root, "log_level", &cfg.log_level);
    ReadIf(root, "sweep_interval_ms", &cfg.sweep_interval_ms);
    ReadIf(root, "host_heartbeat_timeout_ms", &cfg.host_heartbeat_timeout_ms);
    ReadIf(root, "purge_grace_ms", &cfg.purge_grace_ms);
    ReadIf(root, "unbind_timeout_ms", &cfg.lease.unbind_timeout_ms);
    ReadIf(root, "auth_max_skew_sec", &cfg.auth_max_skew_sec);
    ReadIf(root, "event_buffer_size", &cfg.event_buffer_size);
    ReadIf(root, "event_log_path", &cfg.event_log_path);
    ReadIf(root, "event_log_max_bytes", &cfg.event_log_max_bytes);
    ReadIf(root, "idempotency_ttl_sec", &cfg.idempotency_ttl_sec);

    if (root["lease"]) {
      auto lease = root["lease"];
      ReadIf(lease, "default_ttl_ms", &cfg.lease.default_ttl_ms);
      ReadIf(lease, "min_ttl_ms", &cfg.lease.min_ttl_ms);
      ReadIf(lease, "max_ttl_ms", &cfg.lease.max_ttl_ms);
      ReadIf(lease, "unbind_timeout_ms", &cfg.lease.unbind_timeout_ms);
    }

    if (root["host_credentials"]) {
      for (const auto &kv : root["host_credentials"]) {
        cfg.host_credentials[kv.first.as<std::string>()] =
            kv.second.as<std::string>();
      }
    }
  } catch (const std::exception &e) {
    LogError("Failed to parse config %s: %s", yaml_path.c_str(), e.what());
  }

  if (cfg.lease.min_ttl_ms > cfg.lease.max_ttl_ms) {
    LogWarn("lease.min_ttl_ms (%u) > lease.max_ttl_ms (%u), swapping",
            cfg.lease.min_ttl_ms, cfg.lease.max_ttl_ms);
    std::swap(cfg.lease.min_ttl_ms, cfg.lease.max_ttl_ms);
  }
  return cfg;
}

// ──────────────── Export Agent ────────────────

ExportAgentConfig LoadExportAgentConfig(const std::string &yaml_path) {
  ExportAgentConfig cfg;
  try {
    YAML::Node root = YAML::LoadFile(yaml_path);

    ReadIf(root, "host_id", &cfg.host_id);
    ReadIf(root, "broker_address", &cfg.broker_address);
    ReadIf(root, "bind_address", &cfg.bind_address);
    ReadIf(root, "session_port", &cfg.session_port);
    ReadIf(root, "advertise_address", &cfg.advertise_address);
    ReadIf(root, "credential", &cfg.credential);
    ReadIf(root, "credential_path", &cfg.credential_path);
    ReadIf(root, "tls_cert_path", &cfg.tls_cert_path);
    ReadIf(root, "tls_key_path", &cfg.tls_key_path);
    ReadIf(root, "tls_root_cert_path", &cfg.tls_root_cert_path);
    ReadIf(root, "log_level", &cfg.log_level);
    ReadIf(root, "backend", &cfg.backend);
    ReadIf(root, "heartbeat_interval_ms", &cfg.heartbeat_interval_ms);
    ReadIf(root, "missed_heartbeat_limit", &cfg.missed_heartbeat_limit);
    ReadIf(root, "host_heartbeat_interval_ms", &cfg.host_heartbeat_interval_ms);
    ReadIf(root, "rpc_timeout_ms", &cfg.rpc_timeout_ms);
    ReadIf(root, "session_authorize_wait_ms", &cfg.session_authorize_wait_ms);
    ReadIf(root, "default_transfer_timeout_ms", &cfg.default_transfer_timeout_ms);

    if (root["device_filters"]) {
      for (const auto &f : root["device_filters"])
        cfg.device_filters.push_back(ParseFilter(f));
    }
    if (root["simulated_devices"]) {
      for (const auto &d : root["simulated_devices"])
        cfg.simulated_devices.push_back(ParseSimulatedDevice(d));
    }
  } catch (const std::exception &e) {
    LogError("Failed to parse config %s: %s", yaml_path.c_str(), e.what());
  }

  // 密钥文件优先于内联密钥 (避免密钥出现在配置仓库里)
  if (!cfg.credential_path.empty()) {
    std::string secret = TrimWhitespace(ReadFileToString(cfg.credential_path));
    if (secret.empty()) {
      LogWarn("credential_path %s is empty or unreadable",
              cfg.credential_path.c_str());
    } else {
      cfg.credential = secret;
    }
  }

  if (cfg.host_id.empty()) cfg.host_id = GetHostname();
  if (cfg.advertise_address.empty()) {
    cfg.advertise_address = GetHostname() + ":" + std::to_string(cfg.session_port);
  }
  if (cfg.missed_heartbeat_limit == 0) cfg.missed_heartbeat_limit = 1;
  return cfg;
}

// ──────────────── Import Agent ────────────────

ImportAgentConfig LoadImportAgentConfig(const std::string &yaml_path) {
  ImportAgentConfig cfg;
  try {
    YAML::Node root = YAML::LoadFile(yaml_path);

    ReadIf(root, "consumer_id", &cfg.consumer_id);
    ReadIf(root, "broker_address", &cfg.broker_address);
    ReadIf(root, "tls_root_cert_path", &cfg.tls_root_cert_path);
    ReadIf(root, "log_level", &cfg.log_level);
    ReadIf(root, "lease_ttl_ms", &cfg.lease_ttl_ms);
    ReadIf(root, "renew_interval_ms", &cfg.renew_interval_ms);
    ReadIf(root, "rpc_timeout_ms", &cfg.rpc_timeout_ms);
    ReadIf(root, "session_open_timeout_ms", &cfg.session_open_timeout_ms);
    ReadIf(root, "default_transfer_timeout_ms", &cfg.default_transfer_timeout_ms);
    ReadIf(root, "listen_address", &cfg.listen_address);

    if (root["attach_retry"]) {
      auto retry = root["attach_retry"];
      ReadIf(retry, "max_attempts", &cfg.attach_retry.max_attempts);
      ReadIf(retry, "initial_backoff_ms", &cfg.attach_retry.initial_backoff_ms);
      ReadIf(retry, "max_backoff_ms", &cfg.attach_retry.max_backoff_ms);
    }
  } catch (const std::exception &e) {
    LogError("Failed to parse config %s: %s", yaml_path.c_str(), e.what());
  }

  if (cfg.consumer_id.empty()) cfg.consumer_id = GetHostname();
  if (cfg.renew_interval_ms == 0) cfg.renew_interval_ms = cfg.lease_ttl_ms / 3;
  if (cfg.attach_retry.max_attempts < 1) cfg.attach_retry.max_attempts = 1;
  return cfg;
}

} // namespace usb_broker
