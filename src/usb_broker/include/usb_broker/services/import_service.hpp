#pragma once

#include <memory>

#include "grpcpp/grpcpp.h"
#include "import.grpc.pb.h"

namespace usb_broker {
namespace agent {
class ImportAgent;
class LocalDeviceTable;
} // namespace agent
namespace core {
class IdempotencyCache;
} // namespace core

namespace services {

/// 本地消费者接口: attach / detach / 已挂载列表 / 传输
class ImportServiceImpl final : public broker::v1::ImportService::Service {
public:
  ImportServiceImpl(std::shared_ptr<agent::ImportAgent> agent,
                    std::shared_ptr<agent::LocalDeviceTable> table,
                    std::shared_ptr<core::IdempotencyCache> idempotency_cache);

  grpc::Status Attach(grpc::ServerContext *context,
                      const broker::v1::AttachRequest *request,
                      broker::v1::AttachResponse *response) override;

  grpc::Status Detach(grpc::ServerContext *context,
                      const broker::v1::DetachRequest *request,
                      broker::v1::DetachResponse *response) override;

  grpc::Status ListAttached(grpc::ServerContext *context,
                            const broker::v1::ListAttachedRequest *request,
                            broker::v1::ListAttachedResponse *response) override;

  grpc::Status Transfer(grpc::ServerContext *context,
                        const broker::v1::TransferRequest *request,
                        broker::v1::TransferResponse *response) override;

private:
  std::shared_ptr<agent::ImportAgent> agent_;
  std::shared_ptr<agent::LocalDeviceTable> table_;
  std::shared_ptr<core::IdempotencyCache> idempotency_cache_;
};

} // namespace services
} // namespace usb_broker
