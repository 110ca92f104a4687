#pragma once

#include <memory>

#include "broker.grpc.pb.h"
#include "grpcpp/grpcpp.h"

namespace usb_broker {
namespace core {
class DeviceRegistry;
class LeaseCoordinator;
class EventBuffer;
} // namespace core

namespace services {

/// 运维接口: 列表 / 查询 / 强制回收 / 事件流 (兼作设备可用性通知)
class AdminServiceImpl final : public broker::v1::AdminService::Service {
public:
  AdminServiceImpl(std::shared_ptr<core::DeviceRegistry> registry,
                   std::shared_ptr<core::LeaseCoordinator> coordinator,
                   std::shared_ptr<core::EventBuffer> event_buffer);

  grpc::Status ListDevices(grpc::ServerContext *context,
                           const broker::v1::ListDevicesRequest *request,
                           broker::v1::ListDevicesResponse *response) override;

  grpc::Status GetDevice(grpc::ServerContext *context,
                         const broker::v1::GetDeviceRequest *request,
                         broker::v1::GetDeviceResponse *response) override;

  grpc::Status RevokeDevice(grpc::ServerContext *context,
                            const broker::v1::RevokeDeviceRequest *request,
                            broker::v1::RevokeDeviceResponse *response) override;

  grpc::Status StreamEvents(grpc::ServerContext *context,
                            const broker::v1::EventStreamRequest *request,
                            grpc::ServerWriter<broker::v1::Event> *writer) override;

private:
  std::shared_ptr<core::DeviceRegistry> registry_;
  std::shared_ptr<core::LeaseCoordinator> coordinator_;
  std::shared_ptr<core::EventBuffer> event_buffer_;
};

} // namespace services
} // namespace usb_broker
