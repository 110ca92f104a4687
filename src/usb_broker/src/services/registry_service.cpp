#include "usb_broker/services/registry_service.hpp"
#include "usb_broker/common/error.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/core/device_registry.hpp"
#include "usb_broker/core/event_buffer.hpp"
#include "usb_broker/core/host_agent_table.hpp"
#include "usb_broker/core/host_command_hub.hpp"
#include "usb_broker/core/idempotency_cache.hpp"
#include "usb_broker/core/lease_coordinator.hpp"
#include "usb_broker/services/idempotent_rpc.hpp"

#include <chrono>

namespace usb_broker {
namespace services {

RegistryServiceImpl::RegistryServiceImpl(
    std::shared_ptr<core::DeviceRegistry> registry,
    std::shared_ptr<core::LeaseCoordinator> coordinator,
    std::shared_ptr<core::HostAgentTable> hosts,
    std::shared_ptr<core::HostCommandHub> hub,
    std::shared_ptr<core::EventBuffer> event_buffer,
    std::shared_ptr<core::IdempotencyCache> idempotency_cache)
    : registry_(std::move(registry)), coordinator_(std::move(coordinator)),
      hosts_(std::move(hosts)), hub_(std::move(hub)),
      event_buffer_(std::move(event_buffer)),
      idempotency_cache_(std::move(idempotency_cache)) {}

grpc::Status
RegistryServiceImpl::RegisterHost(grpc::ServerContext *context,
                                  const broker::v1::RegisterHostRequest *request,
                                  broker::v1::RegisterHostResponse *response) {
  // Idempotency Check
  core::IdempotentCall call(*idempotency_cache_, "register",
                            request->base().request_id(), kDuplicateWait);
  if (AnswerDuplicate(call, response)) {
    return grpc::Status::OK;
  }

  response->mutable_base()->set_request_id(request->base().request_id());

  std::string token;
  bool was_known = false;
  const BrokerError err = hosts_->Register(
      request->host_id(), request->address(), request->timestamp(),
      request->signature(), request->agent_version(), &token, &was_known);
  if (err != BrokerError::kOk) {
    LogWarn("RegistryService: host %s from %s rejected: %s",
            request->host_id().c_str(), context->peer().c_str(), ToString(err));
    event_buffer_->AddEvent(broker::v1::EVENT_TYPE_HOST_AUTH_FAILED,
                            broker::v1::EVENT_SEVERITY_WARNING, "",
                            "Host registration rejected",
                            request->host_id() + ": " + ToString(err));
    FillResponseBase(err, "host registration rejected", response->mutable_base());
    return grpc::Status::OK;
  }

  // 重启后的 host: 旧设备全部失联, 等待重新上报
  if (was_known) {
    const size_t n =
        registry_->MarkHostUnreachable(request->host_id(), "host agent re-registered");
    if (n > 0) {
      LogInfo("RegistryService: %zu device(s) of %s pending re-report", n,
              request->host_id().c_str());
    }
  }

  response->set_host_token(token);
  response->set_heartbeat_timeout_ms(
      static_cast<uint32_t>(hosts_->heartbeat_timeout().count()));
  FillResponseBase(BrokerError::kOk, "", response->mutable_base());

  event_buffer_->AddEvent(broker::v1::EVENT_TYPE_HOST_REGISTERED,
                          broker::v1::EVENT_SEVERITY_INFO, "",
                          "Host registered: " + request->host_id(),
                          request->address() +
                              (was_known ? " (re-registration)" : ""));

  // Cache Result
  RecordResult(call, *response);
  return grpc::Status::OK;
}

grpc::Status
RegistryServiceImpl::HostHeartbeat(grpc::ServerContext *,
                                   const broker::v1::HostHeartbeatRequest *request,
                                   broker::v1::HostHeartbeatResponse *response) {
  response->mutable_base()->set_request_id(request->base().request_id());
  const BrokerError err = hosts_->Heartbeat(request->host_id(),
                                            request->host_token(),
                                            request->active_sessions());
  FillResponseBase(err, "", response->mutable_base());
  return grpc::Status::OK;
}

grpc::Status
RegistryServiceImpl::ReportDevice(grpc::ServerContext *,
                                  const broker::v1::ReportDeviceRequest *request,
                                  broker::v1::ReportDeviceResponse *response) {
  response->mutable_base()->set_request_id(request->base().request_id());

  BrokerError err = hosts_->Authenticate(request->host_id(), request->host_token());
  if (err != BrokerError::kOk) {
    FillResponseBase(err, "host not authenticated", response->mutable_base());
    return grpc::Status::OK;
  }

  std::string device_id;
  broker::v1::DeviceState state = broker::v1::DEVICE_STATE_UNSPECIFIED;
  err = registry_->Register(request->host_id(), request->device_descriptor(), &device_id,
                            &state);
  if (err == BrokerError::kOk) {
    hosts_->TrackDevice(request->host_id(), device_id);
    response->set_device_id(device_id);
    response->set_state(state);
  }
  FillResponseBase(err, "", response->mutable_base());
  return grpc::Status::OK;
}

grpc::Status
RegistryServiceImpl::RemoveDevice(grpc::ServerContext *,
                                  const broker::v1::RemoveDeviceRequest *request,
                                  broker::v1::RemoveDeviceResponse *response) {
  response->mutable_base()->set_request_id(request->base().request_id());

  BrokerError err = hosts_->Authenticate(request->host_id(), request->host_token());
  if (err != BrokerError::kOk) {
    FillResponseBase(err, "host not authenticated", response->mutable_base());
    return grpc::Status::OK;
  }

  core::DeviceRecord record;
  err = registry_->Get(request->device_id(), &record);
  if (err == BrokerError::kOk && record.host_id != request->host_id()) {
    FillResponseBase(BrokerError::kUnauthenticated,
                     "device belongs to another host", response->mutable_base());
    return grpc::Status::OK;
  }
  if (err == BrokerError::kOk) {
    err = registry_->Deregister(request->device_id(),
                                request->reason().empty() ? "removed by host agent"
                                                          : request->reason());
    hosts_->UntrackDevice(request->host_id(), request->device_id());
  }
  FillResponseBase(err, "", response->mutable_base());
  return grpc::Status::OK;
}

grpc::Status RegistryServiceImpl::ReportSessionState(
    grpc::ServerContext *, const broker::v1::ReportSessionStateRequest *request,
    broker::v1::ReportSessionStateResponse *response) {
  response->mutable_base()->set_request_id(request->base().request_id());

  BrokerError err = hosts_->Authenticate(request->host_id(), request->host_token());
  if (err != BrokerError::kOk) {
    FillResponseBase(err, "host not authenticated", response->mutable_base());
    return grpc::Status::OK;
  }

  // SESSION_STARTED / SESSION_ENDED 由 coordinator 产生
  err = coordinator_->OnSessionState(
      request->device_id(), request->lease_token(), request->active(),
      request->active() ? std::string()
                        : broker::v1::CloseReason_Name(request->end_reason()));
  FillResponseBase(err, "", response->mutable_base());
  return grpc::Status::OK;
}

grpc::Status RegistryServiceImpl::WatchHostCommands(
    grpc::ServerContext *context,
    const broker::v1::WatchHostCommandsRequest *request,
    grpc::ServerWriter<broker::v1::HostCommand> *writer) {
  BrokerError err = hosts_->Authenticate(request->host_id(), request->host_token());
  if (err != BrokerError::kOk) {
    return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, ToString(err));
  }

  auto queue = hub_->Subscribe(request->host_id());
  LogInfo("RegistryService: %s watching commands (%s)", request->host_id().c_str(),
          context->peer().c_str());

  grpc::Status status = grpc::Status::OK;
  broker::v1::HostCommand cmd;
  while (!context->IsCancelled()) {
    if (queue->WaitPop(&cmd, std::chrono::milliseconds(500))) {
      if (!writer->Write(cmd)) break;
      continue;
    }
    if (queue->IsClosed()) break;  // 被新的订阅替换, 或 broker 停止
    // host 超时后令牌失效, 结束流让 agent 重新注册
    err = hosts_->Authenticate(request->host_id(), request->host_token());
    if (err != BrokerError::kOk) {
      status = grpc::Status(grpc::StatusCode::UNAUTHENTICATED, ToString(err));
      break;
    }
  }

  hub_->Unsubscribe(request->host_id(), queue);
  LogInfo("RegistryService: %s command stream closed", request->host_id().c_str());
  return status;
}

} // namespace services
} // namespace usb_broker
