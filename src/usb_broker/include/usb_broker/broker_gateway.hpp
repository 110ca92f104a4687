#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "grpcpp/grpcpp.h"
#include "usb_broker/common/config.hpp"

namespace usb_broker {

namespace core {
class DeviceRegistry;
class LeaseCoordinator;
class HostAgentTable;
class HostCommandHub;
class EventBuffer;
class IdempotencyCache;
}

namespace services {
class RegistryServiceImpl;
class LeaseServiceImpl;
class AdminServiceImpl;
}

/**
 * BrokerGateway: usb_brokerd 的装配点
 *
 * 构造全部核心组件并接线, 托管 gRPC 服务, 后台线程周期执行:
 * 租约过期清扫 / host 心跳超时 / Unreachable 设备清除 / 去重缓存清理
 */
class BrokerGateway {
public:
  explicit BrokerGateway(const BrokerConfig &config);
  ~BrokerGateway();

  /// listen = false 时只提供进程内通道 (测试)
  bool Start(bool listen = true);
  void Stop();
  void Wait();

  /// 进程内 gRPC 通道, Start 之后可用
  std::shared_ptr<grpc::Channel> InProcessChannel();

  /// 执行一轮后台维护 (后台线程按 sweep_interval_ms 调用)
  void SweepOnce();

  std::string listen_address() const;

  std::shared_ptr<core::DeviceRegistry> registry() const { return registry_; }
  std::shared_ptr<core::LeaseCoordinator> coordinator() const { return coordinator_; }
  std::shared_ptr<core::HostAgentTable> hosts() const { return hosts_; }
  std::shared_ptr<core::EventBuffer> events() const { return event_buffer_; }

private:
  void Run();

  BrokerConfig config_;

  // 核心组件
  std::shared_ptr<core::EventBuffer> event_buffer_;
  std::shared_ptr<core::DeviceRegistry> registry_;
  std::shared_ptr<core::LeaseCoordinator> coordinator_;
  std::shared_ptr<core::HostAgentTable> hosts_;
  std::shared_ptr<core::HostCommandHub> hub_;
  std::shared_ptr<core::IdempotencyCache> idempotency_cache_;

  // 服务实现
  std::shared_ptr<services::RegistryServiceImpl> registry_service_;
  std::shared_ptr<services::LeaseServiceImpl> lease_service_;
  std::shared_ptr<services::AdminServiceImpl> admin_service_;

  std::unique_ptr<grpc::Server> server_;
  std::thread thread_;
  std::atomic<bool> stop_{false};
};

}  // namespace usb_broker
