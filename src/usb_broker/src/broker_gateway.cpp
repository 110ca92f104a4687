#include "usb_broker/broker_gateway.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/core/device_registry.hpp"
#include "usb_broker/core/event_buffer.hpp"
#include "usb_broker/core/host_agent_table.hpp"
#include "usb_broker/core/host_command_hub.hpp"
#include "usb_broker/core/idempotency_cache.hpp"
#include "usb_broker/core/lease_coordinator.hpp"
#include "usb_broker/services/admin_service.hpp"
#include "usb_broker/services/lease_service.hpp"
#include "usb_broker/services/registry_service.hpp"
#include "usb_broker/services/server_credentials.hpp"

#include <chrono>

namespace usb_broker {

BrokerGateway::BrokerGateway(const BrokerConfig &config) : config_(config) {
  // 创建核心组件 (解耦: 每个模块独立构造)
  event_buffer_ = std::make_shared<core::EventBuffer>(config_.event_buffer_size);
  if (!config_.event_log_path.empty()) {
    event_buffer_->EnablePersistence(config_.event_log_path,
                                     config_.event_log_max_bytes);
  }

  registry_ = std::make_shared<core::DeviceRegistry>(
      std::chrono::milliseconds(config_.purge_grace_ms));
  registry_->SetEventBuffer(event_buffer_);

  coordinator_ = std::make_shared<core::LeaseCoordinator>(registry_, config_.lease);
  coordinator_->SetEventBuffer(event_buffer_);

  hosts_ = std::make_shared<core::HostAgentTable>(
      config_.host_credentials,
      std::chrono::milliseconds(config_.host_heartbeat_timeout_ms),
      config_.auth_max_skew_sec);

  // 租约授予 / 结束 → START_SESSION / STOP_SESSION 命令
  hub_ = std::make_shared<core::HostCommandHub>(registry_);
  coordinator_->SetListener(hub_);

  idempotency_cache_ =
      std::make_shared<core::IdempotencyCache>(config_.idempotency_ttl_sec);

  // 创建服务实现
  registry_service_ = std::make_shared<services::RegistryServiceImpl>(
      registry_, coordinator_, hosts_, hub_, event_buffer_, idempotency_cache_);
  lease_service_ = std::make_shared<services::LeaseServiceImpl>(
      registry_, coordinator_, hosts_, idempotency_cache_);
  admin_service_ = std::make_shared<services::AdminServiceImpl>(
      registry_, coordinator_, event_buffer_);
}

BrokerGateway::~BrokerGateway() { Stop(); }

std::string BrokerGateway::listen_address() const {
  return config_.bind_address + ":" + std::to_string(config_.grpc_port);
}

bool BrokerGateway::Start(bool listen) {
  grpc::ServerBuilder builder;
  if (listen) {
    builder.AddListeningPort(listen_address(),
                             services::MakeServerCredentials(config_.tls_cert_path,
                                                             config_.tls_key_path));
  }

  // 注册所有服务
  builder.RegisterService(registry_service_.get());
  builder.RegisterService(lease_service_.get());
  builder.RegisterService(admin_service_.get());

  server_ = builder.BuildAndStart();
  if (!server_) {
    LogError("BrokerGateway: failed to start gRPC server on %s",
             listen_address().c_str());
    return false;
  }
  if (listen) {
    LogInfo("BrokerGateway: listening on %s", listen_address().c_str());
  }

  stop_.store(false);
  thread_ = std::thread([this]() { Run(); });
  return true;
}

void BrokerGateway::Stop() {
  if (stop_.exchange(true)) return;
  // 先结束命令流, 否则 Shutdown 会等待它们
  if (hub_) hub_->CloseAll();
  if (server_) {
    server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  }
  if (thread_.joinable()) {
    thread_.join();
  }
}

void BrokerGateway::Wait() {
  if (server_) server_->Wait();
}

std::shared_ptr<grpc::Channel> BrokerGateway::InProcessChannel() {
  if (!server_) return nullptr;
  return server_->InProcessChannel(grpc::ChannelArguments());
}

void BrokerGateway::SweepOnce() {
  const size_t expired = coordinator_->SweepExpired();
  if (expired > 0) {
    LogInfo("BrokerGateway: %zu lease(s) expired", expired);
  }

  for (const auto &host_id : hosts_->CollectTimedOut()) {
    const size_t n = registry_->MarkHostUnreachable(host_id, "host heartbeat timeout");
    LogWarn("BrokerGateway: host %s unreachable, %zu device(s) affected",
            host_id.c_str(), n);
    event_buffer_->AddEvent(broker::v1::EVENT_TYPE_HOST_UNREACHABLE,
                            broker::v1::EVENT_SEVERITY_WARNING, "",
                            "Host unreachable: " + host_id,
                            std::to_string(n) + " device(s) marked unreachable");
  }

  registry_->PurgeUnreachable();
}

void BrokerGateway::Run() {
  // 后台循环: 租约清扫需要高频 (≤ sweep_interval), 去重缓存清理 1s 一次即可
  const auto interval = std::chrono::milliseconds(
      config_.sweep_interval_ms > 0 ? config_.sweep_interval_ms : 500);
  auto last_sweep = std::chrono::steady_clock::now();
  auto last_slow_check = last_sweep;
  while (!stop_.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const auto now = std::chrono::steady_clock::now();
    if (now - last_sweep >= interval) {
      SweepOnce();
      last_sweep = now;
    }
    if (now - last_slow_check > std::chrono::seconds(1)) {
      idempotency_cache_->Cleanup();
      last_slow_check = now;
    }
  }
}

}  // namespace usb_broker
