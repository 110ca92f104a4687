#include "usb_broker/services/lease_service.hpp"
#include "usb_broker/common/error.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/core/device_registry.hpp"
#include "usb_broker/core/host_agent_table.hpp"
#include "usb_broker/core/idempotency_cache.hpp"
#include "usb_broker/core/lease_coordinator.hpp"
#include "usb_broker/services/idempotent_rpc.hpp"

#include <algorithm>

namespace usb_broker {
namespace services {

namespace {

// 不可达时建议的重试间隔上限
constexpr uint32_t kMaxRetryAfterMs = 5000;

} // namespace

LeaseServiceImpl::LeaseServiceImpl(
    std::shared_ptr<core::DeviceRegistry> registry,
    std::shared_ptr<core::LeaseCoordinator> coordinator,
    std::shared_ptr<core::HostAgentTable> hosts,
    std::shared_ptr<core::IdempotencyCache> idempotency_cache)
    : registry_(std::move(registry)), coordinator_(std::move(coordinator)),
      hosts_(std::move(hosts)), idempotency_cache_(std::move(idempotency_cache)) {}

std::string LeaseServiceImpl::ExtractPeerId(grpc::ServerContext *context) {
  if (context == nullptr) {
    return "unknown";
  }
  // gRPC peer() 返回 "ipv4:x.x.x.x:port" 或 "ipv6:[::]:port"
  std::string peer = context->peer();
  if (peer.empty()) {
    return "unknown";
  }
  return peer;
}

std::string LeaseServiceImpl::SessionAddressOf(const std::string &device_id) const {
  core::DeviceRecord record;
  if (registry_->Get(device_id, &record) != BrokerError::kOk) return {};
  return hosts_->AddressOf(record.host_id);
}

grpc::Status
LeaseServiceImpl::AcquireLease(grpc::ServerContext *context,
                               const broker::v1::AcquireLeaseRequest *request,
                               broker::v1::AcquireLeaseResponse *response) {
  // Idempotency Check: 并发的重复请求等第一次的结果
  core::IdempotentCall call(*idempotency_cache_, "acquire",
                            request->base().request_id(), kDuplicateWait);
  if (AnswerDuplicate(call, response)) {
    return grpc::Status::OK;
  }

  response->mutable_base()->set_request_id(request->base().request_id());

  const std::string consumer = request->consumer_id().empty()
                                   ? ExtractPeerId(context)
                                   : request->consumer_id();
  core::LeaseRecord lease;
  const BrokerError err =
      coordinator_->Acquire(request->device_id(), consumer,
                            std::chrono::milliseconds(request->ttl_ms()), &lease);
  switch (err) {
    case BrokerError::kOk:
      core::FillLease(request->device_id(), lease, response->mutable_lease());
      response->mutable_lease()->set_session_address(
          SessionAddressOf(request->device_id()));
      FillResponseBase(err, "", response->mutable_base());
      break;
    case BrokerError::kBusy:
      FillResponseBase(err, "device is leased or still unbinding",
                       response->mutable_base());
      break;
    case BrokerError::kUnreachable: {
      FillResponseBase(err, "host agent unreachable", response->mutable_base());
      const auto timeout = static_cast<uint32_t>(hosts_->heartbeat_timeout().count());
      response->mutable_base()->set_retry_after_ms(std::min(timeout, kMaxRetryAfterMs));
      break;
    }
    default:
      FillResponseBase(err, "", response->mutable_base());
      break;
  }

  // Cache Result
  RecordResult(call, *response);
  return grpc::Status::OK;
}

grpc::Status
LeaseServiceImpl::RenewLease(grpc::ServerContext *,
                             const broker::v1::RenewLeaseRequest *request,
                             broker::v1::RenewLeaseResponse *response) {
  // Idempotency Check: 并发的重复请求等第一次的结果
  core::IdempotentCall call(*idempotency_cache_, "renew",
                            request->base().request_id(), kDuplicateWait);
  if (AnswerDuplicate(call, response)) {
    return grpc::Status::OK;
  }

  response->mutable_base()->set_request_id(request->base().request_id());

  core::LeaseRecord lease;
  const BrokerError err = coordinator_->Renew(request->lease_token(), &lease);
  std::string device_id;
  uint64_t generation = 0;
  if (err == BrokerError::kOk &&
      core::LeaseCoordinator::ParseToken(request->lease_token(), &device_id,
                                         &generation)) {
    core::FillLease(device_id, lease, response->mutable_lease());
    response->mutable_lease()->set_session_address(SessionAddressOf(device_id));
  }
  FillResponseBase(err, err == BrokerError::kExpired ? "lease expired" : "",
                   response->mutable_base());

  // Cache Result
  RecordResult(call, *response);
  return grpc::Status::OK;
}

grpc::Status
LeaseServiceImpl::ReleaseLease(grpc::ServerContext *,
                               const broker::v1::ReleaseLeaseRequest *request,
                               broker::v1::ReleaseLeaseResponse *response) {
  // Idempotency Check: 并发的重复请求等第一次的结果
  core::IdempotentCall call(*idempotency_cache_, "release",
                            request->base().request_id(), kDuplicateWait);
  if (AnswerDuplicate(call, response)) {
    return grpc::Status::OK;
  }

  response->mutable_base()->set_request_id(request->base().request_id());
  const BrokerError err = coordinator_->Release(request->lease_token());
  FillResponseBase(err, "", response->mutable_base());

  // Cache Result
  RecordResult(call, *response);
  return grpc::Status::OK;
}

} // namespace services
} // namespace usb_broker
