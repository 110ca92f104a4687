#pragma once

#include <memory>
#include <string>

#include "broker.grpc.pb.h"
#include "grpcpp/grpcpp.h"

namespace usb_broker {
namespace core {
class DeviceRegistry;
class LeaseCoordinator;
class HostAgentTable;
class HostCommandHub;
class EventBuffer;
class IdempotencyCache;
} // namespace core

namespace services {

/// Export Agent → broker: 注册 / 心跳 / 设备上报 / 会话状态 / 命令流
class RegistryServiceImpl final : public broker::v1::RegistryService::Service {
public:
  RegistryServiceImpl(std::shared_ptr<core::DeviceRegistry> registry,
                      std::shared_ptr<core::LeaseCoordinator> coordinator,
                      std::shared_ptr<core::HostAgentTable> hosts,
                      std::shared_ptr<core::HostCommandHub> hub,
                      std::shared_ptr<core::EventBuffer> event_buffer,
                      std::shared_ptr<core::IdempotencyCache> idempotency_cache);

  grpc::Status RegisterHost(grpc::ServerContext *context,
                            const broker::v1::RegisterHostRequest *request,
                            broker::v1::RegisterHostResponse *response) override;

  grpc::Status HostHeartbeat(grpc::ServerContext *context,
                             const broker::v1::HostHeartbeatRequest *request,
                             broker::v1::HostHeartbeatResponse *response) override;

  grpc::Status ReportDevice(grpc::ServerContext *context,
                            const broker::v1::ReportDeviceRequest *request,
                            broker::v1::ReportDeviceResponse *response) override;

  grpc::Status RemoveDevice(grpc::ServerContext *context,
                            const broker::v1::RemoveDeviceRequest *request,
                            broker::v1::RemoveDeviceResponse *response) override;

  grpc::Status
  ReportSessionState(grpc::ServerContext *context,
                     const broker::v1::ReportSessionStateRequest *request,
                     broker::v1::ReportSessionStateResponse *response) override;

  grpc::Status WatchHostCommands(
      grpc::ServerContext *context,
      const broker::v1::WatchHostCommandsRequest *request,
      grpc::ServerWriter<broker::v1::HostCommand> *writer) override;

private:
  std::shared_ptr<core::DeviceRegistry> registry_;
  std::shared_ptr<core::LeaseCoordinator> coordinator_;
  std::shared_ptr<core::HostAgentTable> hosts_;
  std::shared_ptr<core::HostCommandHub> hub_;
  std::shared_ptr<core::EventBuffer> event_buffer_;
  std::shared_ptr<core::IdempotencyCache> idempotency_cache_;
};

} // namespace services
} // namespace usb_broker
