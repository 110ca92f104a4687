#include "usb_broker/services/admin_service.hpp"
#include "usb_broker/common/error.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/core/device_registry.hpp"
#include "usb_broker/core/event_buffer.hpp"
#include "usb_broker/core/lease_coordinator.hpp"

#include <algorithm>
#include <chrono>

namespace usb_broker {
namespace services {

namespace {

bool MatchesRequest(const broker::v1::Event &event,
                    const broker::v1::EventStreamRequest &request) {
  if (request.filter_types_size() > 0) {
    const auto &types = request.filter_types();
    if (std::find(types.begin(), types.end(), event.type()) == types.end()) {
      return false;
    }
  }
  if (request.min_severity() != broker::v1::EVENT_SEVERITY_UNSPECIFIED &&
      event.severity() < request.min_severity()) {
    return false;
  }
  if (!request.device_id().empty() && event.device_id() != request.device_id()) {
    return false;
  }
  return true;
}

} // namespace

AdminServiceImpl::AdminServiceImpl(
    std::shared_ptr<core::DeviceRegistry> registry,
    std::shared_ptr<core::LeaseCoordinator> coordinator,
    std::shared_ptr<core::EventBuffer> event_buffer)
    : registry_(std::move(registry)), coordinator_(std::move(coordinator)),
      event_buffer_(std::move(event_buffer)) {}

grpc::Status
AdminServiceImpl::ListDevices(grpc::ServerContext *,
                              const broker::v1::ListDevicesRequest *request,
                              broker::v1::ListDevicesResponse *response) {
  response->mutable_base()->set_request_id(request->base().request_id());

  core::DeviceQuery query;
  query.state = request->state();
  query.host_id = request->host_id();
  query.vendor_id = request->vendor_id();
  for (const auto &record : registry_->List(query)) {
    core::FillDeviceSummary(record, response->add_devices());
  }
  FillResponseBase(BrokerError::kOk, "", response->mutable_base());
  return grpc::Status::OK;
}

grpc::Status
AdminServiceImpl::GetDevice(grpc::ServerContext *,
                            const broker::v1::GetDeviceRequest *request,
                            broker::v1::GetDeviceResponse *response) {
  response->mutable_base()->set_request_id(request->base().request_id());

  core::DeviceRecord record;
  const BrokerError err = registry_->Get(request->device_id(), &record);
  if (err == BrokerError::kOk) {
    core::FillDeviceSummary(record, response->mutable_device());
  }
  FillResponseBase(err, err == BrokerError::kNotFound ? "unknown device" : "",
                   response->mutable_base());
  return grpc::Status::OK;
}

grpc::Status
AdminServiceImpl::RevokeDevice(grpc::ServerContext *context,
                               const broker::v1::RevokeDeviceRequest *request,
                               broker::v1::RevokeDeviceResponse *response) {
  response->mutable_base()->set_request_id(request->base().request_id());

  const std::string reason =
      request->reason().empty() ? "administrative revoke" : request->reason();
  std::string consumer;
  const BrokerError err = coordinator_->Revoke(request->device_id(), reason, &consumer);
  LogInfo("AdminService: revoke %s by %s (%s): %s", request->device_id().c_str(),
          context->peer().c_str(), reason.c_str(), ToString(err));
  response->set_revoked_consumer(consumer);

  std::string message;
  if (err == BrokerError::kNotFound) message = "unknown device";
  if (err == BrokerError::kAlreadyFree) message = "device is not leased";
  FillResponseBase(err, message, response->mutable_base());
  return grpc::Status::OK;
}

grpc::Status
AdminServiceImpl::StreamEvents(grpc::ServerContext *context,
                               const broker::v1::EventStreamRequest *request,
                               grpc::ServerWriter<broker::v1::Event> *writer) {
  std::string cursor = request->last_event_id();

  if (request->skip_history()) {
    cursor = event_buffer_->LatestEventId();
  } else {
    // 补发断线期间的历史事件
    for (const auto &event : event_buffer_->GetEventsSince(cursor)) {
      cursor = event.event_id();
      if (!MatchesRequest(event, *request)) continue;
      if (!writer->Write(event)) {
        return grpc::Status::OK;
      }
    }
  }

  if (!request->follow()) {
    return grpc::Status::OK;
  }

  while (!context->IsCancelled()) {
    broker::v1::Event event;
    if (!event_buffer_->WaitForEventAfter(cursor, &event,
                                          std::chrono::milliseconds(1000))) {
      continue;
    }
    cursor = event.event_id();
    if (!MatchesRequest(event, *request)) continue;
    if (!writer->Write(event)) {
      break;
    }
  }

  return grpc::Status::OK;
}

} // namespace services
} // namespace usb_broker
