#pragma once

#include <memory>

#include "grpcpp/grpcpp.h"
#include "session.grpc.pb.h"

namespace usb_broker {
namespace agent {
class ExportAgent;
} // namespace agent

namespace services {

/// Export Agent 侧的 Session Transport 端点. 每个 Open 流对应一个会话.
class SessionServiceImpl final : public broker::v1::SessionService::Service {
public:
  explicit SessionServiceImpl(std::shared_ptr<agent::ExportAgent> agent);

  grpc::Status Open(grpc::ServerContext *context,
                    grpc::ServerReaderWriter<broker::v1::Frame, broker::v1::Frame>
                        *stream) override;

private:
  std::shared_ptr<agent::ExportAgent> agent_;
};

} // namespace services
} // namespace usb_broker
