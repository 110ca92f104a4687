#include "usb_broker/services/session_service.hpp"
#include "usb_broker/agent/export_agent.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/transport/grpc_stream_channel.hpp"

#include <future>

namespace usb_broker {
namespace services {

SessionServiceImpl::SessionServiceImpl(std::shared_ptr<agent::ExportAgent> agent)
    : agent_(std::move(agent)) {}

grpc::Status SessionServiceImpl::Open(
    grpc::ServerContext *context,
    grpc::ServerReaderWriter<broker::v1::Frame, broker::v1::Frame> *stream) {
  using Stream = grpc::ServerReaderWriter<broker::v1::Frame, broker::v1::Frame>;

  auto read_done = std::make_shared<std::promise<void>>();
  std::future<void> read_finished = read_done->get_future();

  auto channel = std::make_shared<transport::GrpcStreamChannel<Stream>>(
      stream, [context] { context->TryCancel(); }, context->peer(),
      [read_done] { read_done->set_value(); });

  LogDebug("SessionService: stream opened by %s", context->peer().c_str());
  agent_->ServeSession(channel);

  // handler 返回后 stream 失效, 读线程必须先退出
  channel->Close();
  read_finished.wait();
  return grpc::Status::OK;
}

} // namespace services
} // namespace usb_broker
