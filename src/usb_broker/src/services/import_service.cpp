#include "usb_broker/services/import_service.hpp"
#include "usb_broker/agent/import_agent.hpp"
#include "usb_broker/agent/virtual_device.hpp"
#include "usb_broker/common/error.hpp"
#include "usb_broker/core/idempotency_cache.hpp"
#include "usb_broker/services/idempotent_rpc.hpp"

namespace usb_broker {
namespace services {

ImportServiceImpl::ImportServiceImpl(
    std::shared_ptr<agent::ImportAgent> agent,
    std::shared_ptr<agent::LocalDeviceTable> table,
    std::shared_ptr<core::IdempotencyCache> idempotency_cache)
    : agent_(std::move(agent)), table_(std::move(table)),
      idempotency_cache_(std::move(idempotency_cache)) {}

grpc::Status ImportServiceImpl::Attach(grpc::ServerContext *,
                                       const broker::v1::AttachRequest *request,
                                       broker::v1::AttachResponse *response) {
  // Idempotency Check: 重试的 attach 不会再占一个租约
  core::IdempotentCall call(*idempotency_cache_, "attach",
                            request->base().request_id(), kDuplicateWait);
  if (AnswerDuplicate(call, response)) {
    return grpc::Status::OK;
  }

  response->mutable_base()->set_request_id(request->base().request_id());

  std::string handle;
  broker::v1::DeviceDescriptor descriptor;
  uint32_t retry_after = 0;
  const BrokerError err =
      request->wait_if_busy()
          ? agent_->AttachWithRetry(request->device_id(), &handle, &descriptor)
          : agent_->Attach(request->device_id(), &handle, &descriptor, &retry_after);
  if (err == BrokerError::kOk) {
    response->set_local_handle(handle);
    *response->mutable_device_descriptor() = descriptor;
  }
  FillResponseBase(err, "", response->mutable_base());
  if (retry_after > 0) response->mutable_base()->set_retry_after_ms(retry_after);

  // Cache Result
  RecordResult(call, *response);
  return grpc::Status::OK;
}

grpc::Status ImportServiceImpl::Detach(grpc::ServerContext *,
                                       const broker::v1::DetachRequest *request,
                                       broker::v1::DetachResponse *response) {
  response->mutable_base()->set_request_id(request->base().request_id());
  const BrokerError err = agent_->Detach(request->local_handle());
  FillResponseBase(err, err == BrokerError::kNotFound ? "unknown handle" : "",
                   response->mutable_base());
  return grpc::Status::OK;
}

grpc::Status
ImportServiceImpl::ListAttached(grpc::ServerContext *,
                                const broker::v1::ListAttachedRequest *request,
                                broker::v1::ListAttachedResponse *response) {
  response->mutable_base()->set_request_id(request->base().request_id());
  for (const auto &device : table_->List()) {
    auto *out = response->add_devices();
    out->set_local_handle(device->handle());
    out->set_device_id(device->device_id());
    *out->mutable_device_descriptor() = device->descriptor();
    out->set_operational(device->IsOperational());
    out->set_fault(ToProto(device->fault()));
  }
  FillResponseBase(BrokerError::kOk, "", response->mutable_base());
  return grpc::Status::OK;
}

grpc::Status ImportServiceImpl::Transfer(grpc::ServerContext *,
                                         const broker::v1::TransferRequest *request,
                                         broker::v1::TransferResponse *response) {
  response->mutable_base()->set_request_id(request->base().request_id());

  transport::TransferResult result;
  const BrokerError err =
      agent_->Transfer(request->local_handle(), request->transfer(), &result);
  if (err != BrokerError::kNotFound) {
    response->set_status(result.status);
    response->set_data(result.data);
    response->set_actual_length(result.actual_length);
  }
  FillResponseBase(err, err == BrokerError::kNotFound ? "unknown handle" : "",
                   response->mutable_base());
  return grpc::Status::OK;
}

} // namespace services
} // namespace usb_broker
