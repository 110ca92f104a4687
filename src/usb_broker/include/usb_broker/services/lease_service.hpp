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
class IdempotencyCache;
} // namespace core

namespace services {

class LeaseServiceImpl final : public broker::v1::LeaseService::Service {
public:
  LeaseServiceImpl(std::shared_ptr<core::DeviceRegistry> registry,
                   std::shared_ptr<core::LeaseCoordinator> coordinator,
                   std::shared_ptr<core::HostAgentTable> hosts,
                   std::shared_ptr<core::IdempotencyCache> idempotency_cache);

  grpc::Status AcquireLease(grpc::ServerContext *context,
                            const broker::v1::AcquireLeaseRequest *request,
                            broker::v1::AcquireLeaseResponse *response) override;

  grpc::Status RenewLease(grpc::ServerContext *context,
                          const broker::v1::RenewLeaseRequest *request,
                          broker::v1::RenewLeaseResponse *response) override;

  grpc::Status ReleaseLease(grpc::ServerContext *context,
                            const broker::v1::ReleaseLeaseRequest *request,
                            broker::v1::ReleaseLeaseResponse *response) override;

private:
  // 未提供 consumer_id 时以 gRPC peer 作为消费者标识
  static std::string ExtractPeerId(grpc::ServerContext *context);

  std::string SessionAddressOf(const std::string &device_id) const;

  std::shared_ptr<core::DeviceRegistry> registry_;
  std::shared_ptr<core::LeaseCoordinator> coordinator_;
  std::shared_ptr<core::HostAgentTable> hosts_;
  std::shared_ptr<core::IdempotencyCache> idempotency_cache_;
};

} // namespace services
} // namespace usb_broker
