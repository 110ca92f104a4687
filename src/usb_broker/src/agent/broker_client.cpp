#include "usb_broker/agent/broker_client.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"
#include "usb_broker/transport/grpc_stream_channel.hpp"

#include <grpcpp/security/credentials.h>

namespace usb_broker {
namespace agent {

namespace {

bool IsTransient(const grpc::Status &status) {
  return status.error_code() == grpc::StatusCode::UNAVAILABLE ||
         status.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED;
}

void ToGrant(const broker::v1::Lease &lease, LeaseGrant *grant) {
  if (grant == nullptr) return;
  grant->token = lease.lease_token();
  grant->device_id = lease.device_id();
  grant->generation = lease.generation();
  grant->ttl = std::chrono::milliseconds(lease.ttl().seconds() * 1000 +
                                         lease.ttl().nanos() / 1000000);
  grant->session_address = lease.session_address();
}

}  // namespace

BrokerClient::BrokerClient(std::shared_ptr<grpc::Channel> channel,
                           std::chrono::milliseconds rpc_timeout)
    : channel_(std::move(channel)),
      rpc_timeout_(rpc_timeout),
      registry_(broker::v1::RegistryService::NewStub(channel_)),
      lease_(broker::v1::LeaseService::NewStub(channel_)),
      admin_(broker::v1::AdminService::NewStub(channel_)) {}

BrokerClient::~BrokerClient() { CancelWatch(); }

std::shared_ptr<grpc::Channel>
BrokerClient::MakeChannel(const std::string &address,
                          const std::string &root_cert_path) {
  std::shared_ptr<grpc::ChannelCredentials> creds;
  if (!root_cert_path.empty()) {
    grpc::SslCredentialsOptions opts;
    opts.pem_root_certs = ReadFileToString(root_cert_path);
    if (opts.pem_root_certs.empty()) {
      LogWarn("BrokerClient: root cert %s unreadable, using insecure channel",
              root_cert_path.c_str());
      creds = grpc::InsecureChannelCredentials();
    } else {
      creds = grpc::SslCredentials(opts);
    }
  } else {
    creds = grpc::InsecureChannelCredentials();
  }
  return grpc::CreateChannel(address, creds);
}

void BrokerClient::PrepareBase(broker::v1::RequestBase *base) const {
  base->set_request_id(NewRequestId());
  ToProtoTimestamp(std::chrono::system_clock::now(),
                   base->mutable_client_timestamp());
}

template <typename Request, typename Response, typename Call>
BrokerError BrokerClient::Invoke(const Request &request, Response *response,
                                 Call call, const char *name) {
  grpc::Status status;
  for (int attempt = 0; attempt < 2; ++attempt) {
    grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + rpc_timeout_);
    status = call(&ctx, request, response);
    if (status.ok() || !IsTransient(status)) break;
    LogDebug("BrokerClient: %s attempt %d failed: %s", name, attempt + 1,
             status.error_message().c_str());
  }
  if (!status.ok()) {
    LogWarn("BrokerClient: %s failed: %s (%d)", name,
            status.error_message().c_str(),
            static_cast<int>(status.error_code()));
    return FromGrpcStatus(status);
  }
  return FromProto(response->base().error_code());
}

// ──────────────── RegistryService ────────────────

BrokerError BrokerClient::RegisterHost(const std::string &host_id,
                                       const std::string &address,
                                       int64_t timestamp,
                                       const std::string &signature,
                                       std::string *host_token) {
  broker::v1::RegisterHostRequest req;
  PrepareBase(req.mutable_base());
  req.set_host_id(host_id);
  req.set_address(address);
  req.set_timestamp(timestamp);
  req.set_signature(signature);
  req.set_agent_version(USB_BROKER_VERSION);

  broker::v1::RegisterHostResponse resp;
  const BrokerError err = Invoke(
      req, &resp,
      [this](grpc::ClientContext *c, const broker::v1::RegisterHostRequest &r,
             broker::v1::RegisterHostResponse *o) {
        return registry_->RegisterHost(c, r, o);
      },
      "RegisterHost");
  if (err == BrokerError::kOk && host_token) *host_token = resp.host_token();
  return err;
}

BrokerError BrokerClient::Heartbeat(const std::string &host_id,
                                    const std::string &host_token,
                                    uint32_t attached_devices,
                                    uint32_t active_sessions) {
  broker::v1::HostHeartbeatRequest req;
  PrepareBase(req.mutable_base());
  req.set_host_id(host_id);
  req.set_host_token(host_token);
  req.set_attached_devices(attached_devices);
  req.set_active_sessions(active_sessions);

  broker::v1::HostHeartbeatResponse resp;
  return Invoke(
      req, &resp,
      [this](grpc::ClientContext *c, const broker::v1::HostHeartbeatRequest &r,
             broker::v1::HostHeartbeatResponse *o) {
        return registry_->HostHeartbeat(c, r, o);
      },
      "HostHeartbeat");
}

BrokerError BrokerClient::ReportDevice(
    const std::string &host_id, const std::string &host_token,
    const broker::v1::DeviceDescriptor &descriptor, std::string *device_id) {
  broker::v1::ReportDeviceRequest req;
  PrepareBase(req.mutable_base());
  req.set_host_id(host_id);
  req.set_host_token(host_token);
  *req.mutable_device_descriptor() = descriptor;

  broker::v1::ReportDeviceResponse resp;
  const BrokerError err = Invoke(
      req, &resp,
      [this](grpc::ClientContext *c, const broker::v1::ReportDeviceRequest &r,
             broker::v1::ReportDeviceResponse *o) {
        return registry_->ReportDevice(c, r, o);
      },
      "ReportDevice");
  if (err == BrokerError::kOk && device_id) *device_id = resp.device_id();
  return err;
}

BrokerError BrokerClient::RemoveDevice(const std::string &host_id,
                                       const std::string &host_token,
                                       const std::string &device_id,
                                       const std::string &reason) {
  broker::v1::RemoveDeviceRequest req;
  PrepareBase(req.mutable_base());
  req.set_host_id(host_id);
  req.set_host_token(host_token);
  req.set_device_id(device_id);
  req.set_reason(reason);

  broker::v1::RemoveDeviceResponse resp;
  return Invoke(
      req, &resp,
      [this](grpc::ClientContext *c, const broker::v1::RemoveDeviceRequest &r,
             broker::v1::RemoveDeviceResponse *o) {
        return registry_->RemoveDevice(c, r, o);
      },
      "RemoveDevice");
}

BrokerError BrokerClient::ReportSessionState(
    const std::string &host_id, const std::string &host_token,
    const std::string &device_id, const std::string &lease_token, bool active,
    broker::v1::CloseReason end_reason) {
  broker::v1::ReportSessionStateRequest req;
  PrepareBase(req.mutable_base());
  req.set_host_id(host_id);
  req.set_host_token(host_token);
  req.set_device_id(device_id);
  req.set_lease_token(lease_token);
  req.set_active(active);
  req.set_end_reason(end_reason);

  broker::v1::ReportSessionStateResponse resp;
  return Invoke(
      req, &resp,
      [this](grpc::ClientContext *c,
             const broker::v1::ReportSessionStateRequest &r,
             broker::v1::ReportSessionStateResponse *o) {
        return registry_->ReportSessionState(c, r, o);
      },
      "ReportSessionState");
}

BrokerError BrokerClient::WatchCommands(
    const std::string &host_id, const std::string &host_token,
    const std::function<void(const broker::v1::HostCommand &)> &on_command) {
  grpc::ClientContext ctx;
  {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    if (watch_cancelled_) {
      watch_cancelled_ = false;
      return BrokerError::kCancelled;
    }
    watch_context_ = &ctx;
  }

  broker::v1::WatchHostCommandsRequest req;
  req.set_host_id(host_id);
  req.set_host_token(host_token);

  auto reader = registry_->WatchHostCommands(&ctx, req);
  broker::v1::HostCommand cmd;
  while (reader->Read(&cmd)) {
    on_command(cmd);
  }
  const grpc::Status status = reader->Finish();

  bool cancelled;
  {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    watch_context_ = nullptr;
    cancelled = watch_cancelled_;
    watch_cancelled_ = false;
  }
  if (cancelled) return BrokerError::kCancelled;
  if (!status.ok()) {
    LogWarn("BrokerClient: command stream ended: %s",
            status.error_message().c_str());
    return FromGrpcStatus(status);
  }
  return BrokerError::kOk;
}

void BrokerClient::CancelWatch() {
  std::lock_guard<std::mutex> lock(watch_mutex_);
  watch_cancelled_ = true;
  if (watch_context_) watch_context_->TryCancel();
}

// ──────────────── LeaseService ────────────────

BrokerError BrokerClient::Acquire(const std::string &device_id,
                                  const std::string &consumer_id,
                                  std::chrono::milliseconds ttl,
                                  LeaseGrant *grant, uint32_t *retry_after_ms) {
  broker::v1::AcquireLeaseRequest req;
  PrepareBase(req.mutable_base());
  req.set_device_id(device_id);
  req.set_consumer_id(consumer_id);
  req.set_ttl_ms(static_cast<uint32_t>(ttl.count()));

  broker::v1::AcquireLeaseResponse resp;
  const BrokerError err = Invoke(
      req, &resp,
      [this](grpc::ClientContext *c, const broker::v1::AcquireLeaseRequest &r,
             broker::v1::AcquireLeaseResponse *o) {
        return lease_->AcquireLease(c, r, o);
      },
      "AcquireLease");
  if (retry_after_ms) *retry_after_ms = resp.base().retry_after_ms();
  if (err == BrokerError::kOk) ToGrant(resp.lease(), grant);
  return err;
}

BrokerError BrokerClient::Renew(const std::string &lease_token,
                                LeaseGrant *grant) {
  broker::v1::RenewLeaseRequest req;
  PrepareBase(req.mutable_base());
  req.set_lease_token(lease_token);

  broker::v1::RenewLeaseResponse resp;
  const BrokerError err = Invoke(
      req, &resp,
      [this](grpc::ClientContext *c, const broker::v1::RenewLeaseRequest &r,
             broker::v1::RenewLeaseResponse *o) {
        return lease_->RenewLease(c, r, o);
      },
      "RenewLease");
  if (err == BrokerError::kOk) ToGrant(resp.lease(), grant);
  return err;
}

BrokerError BrokerClient::Release(const std::string &lease_token) {
  broker::v1::ReleaseLeaseRequest req;
  PrepareBase(req.mutable_base());
  req.set_lease_token(lease_token);

  broker::v1::ReleaseLeaseResponse resp;
  return Invoke(
      req, &resp,
      [this](grpc::ClientContext *c, const broker::v1::ReleaseLeaseRequest &r,
             broker::v1::ReleaseLeaseResponse *o) {
        return lease_->ReleaseLease(c, r, o);
      },
      "ReleaseLease");
}

bool BrokerClient::WaitForAvailability(const std::string &device_id,
                                       std::chrono::milliseconds timeout) {
  broker::v1::EventStreamRequest req;
  req.set_device_id(device_id);
  req.add_filter_types(broker::v1::EVENT_TYPE_DEVICE_FREED);
  req.set_follow(true);
  req.set_skip_history(true);

  bool freed = false;
  const BrokerError err = StreamEvents(
      req,
      [&freed](const broker::v1::Event &) {
        freed = true;
        return false;
      },
      timeout);
  if (err != BrokerError::kOk && err != BrokerError::kUnreachable) {
    LogDebug("BrokerClient: availability watch for %s ended: %s",
             device_id.c_str(), ToString(err));
  }
  return freed;
}

// ──────────────── AdminService ────────────────

BrokerError BrokerClient::ListDevices(
    const broker::v1::ListDevicesRequest &filter,
    std::vector<broker::v1::DeviceSummary> *devices, std::string *message) {
  broker::v1::ListDevicesRequest req = filter;
  PrepareBase(req.mutable_base());

  broker::v1::ListDevicesResponse resp;
  const BrokerError err = Invoke(
      req, &resp,
      [this](grpc::ClientContext *c, const broker::v1::ListDevicesRequest &r,
             broker::v1::ListDevicesResponse *o) {
        return admin_->ListDevices(c, r, o);
      },
      "ListDevices");
  if (message) *message = resp.base().error_message();
  if (err == BrokerError::kOk && devices) {
    devices->assign(resp.devices().begin(), resp.devices().end());
  }
  return err;
}

BrokerError BrokerClient::GetDevice(const std::string &device_id,
                                    broker::v1::DeviceSummary *device,
                                    std::string *message) {
  broker::v1::GetDeviceRequest req;
  PrepareBase(req.mutable_base());
  req.set_device_id(device_id);

  broker::v1::GetDeviceResponse resp;
  const BrokerError err = Invoke(
      req, &resp,
      [this](grpc::ClientContext *c, const broker::v1::GetDeviceRequest &r,
             broker::v1::GetDeviceResponse *o) {
        return admin_->GetDevice(c, r, o);
      },
      "GetDevice");
  if (message) *message = resp.base().error_message();
  if (err == BrokerError::kOk && device) *device = resp.device();
  return err;
}

BrokerError BrokerClient::RevokeDevice(const std::string &device_id,
                                       const std::string &reason,
                                       std::string *revoked_consumer,
                                       std::string *message) {
  broker::v1::RevokeDeviceRequest req;
  PrepareBase(req.mutable_base());
  req.set_device_id(device_id);
  req.set_reason(reason);

  broker::v1::RevokeDeviceResponse resp;
  const BrokerError err = Invoke(
      req, &resp,
      [this](grpc::ClientContext *c, const broker::v1::RevokeDeviceRequest &r,
             broker::v1::RevokeDeviceResponse *o) {
        return admin_->RevokeDevice(c, r, o);
      },
      "RevokeDevice");
  if (message) *message = resp.base().error_message();
  if (err == BrokerError::kOk && revoked_consumer) {
    *revoked_consumer = resp.revoked_consumer();
  }
  return err;
}

BrokerError BrokerClient::StreamEvents(
    const broker::v1::EventStreamRequest &request,
    const std::function<bool(const broker::v1::Event &)> &on_event,
    std::chrono::milliseconds timeout) {
  grpc::ClientContext ctx;
  if (timeout.count() > 0) {
    ctx.set_deadline(std::chrono::system_clock::now() + timeout);
  }
  auto reader = admin_->StreamEvents(&ctx, request);
  broker::v1::Event event;
  bool stopped = false;
  while (reader->Read(&event)) {
    if (!on_event(event)) {
      stopped = true;
      ctx.TryCancel();
      break;
    }
  }
  if (stopped) {
    // 读完被取消后的残余, 再 Finish
    while (reader->Read(&event)) {
    }
  }
  const grpc::Status status = reader->Finish();
  if (stopped || status.ok()) return BrokerError::kOk;
  // 超时本身是正常结束
  if (status.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED) {
    return BrokerError::kOk;
  }
  return FromGrpcStatus(status);
}

// ──────────────── SessionService 连接器 ────────────────

namespace {

struct ClientStreamHolder {
  std::shared_ptr<grpc::Channel> channel;
  std::unique_ptr<broker::v1::SessionService::Stub> stub;
  grpc::ClientContext context;
  std::unique_ptr<grpc::ClientReaderWriter<broker::v1::Frame, broker::v1::Frame>> stream;
};

}  // namespace

std::shared_ptr<transport::FrameChannel>
GrpcSessionConnector::Connect(const std::string &address,
                              std::chrono::milliseconds timeout,
                              BrokerError *error) {
  auto holder = std::make_shared<ClientStreamHolder>();
  holder->channel = BrokerClient::MakeChannel(address, root_cert_path_);
  if (!holder->channel->WaitForConnected(std::chrono::system_clock::now() +
                                         timeout)) {
    LogWarn("SessionConnector: %s not reachable within %lld ms",
            address.c_str(), static_cast<long long>(timeout.count()));
    if (error) *error = BrokerError::kUnreachable;
    return nullptr;
  }
  holder->stub = broker::v1::SessionService::NewStub(holder->channel);
  holder->stream = holder->stub->Open(&holder->context);
  if (!holder->stream) {
    if (error) *error = BrokerError::kUnreachable;
    return nullptr;
  }

  auto *stream = holder->stream.get();
  auto *context = &holder->context;
  auto channel = std::make_shared<transport::GrpcStreamChannel<
      grpc::ClientReaderWriter<broker::v1::Frame, broker::v1::Frame>>>(
      stream, [context] { context->TryCancel(); }, address,
      [stream] {
        // 持有写锁调用, 不会与 Write 并发
        stream->WritesDone();
        const grpc::Status status = stream->Finish();
        if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) {
          LogDebug("SessionConnector: stream finished: %s",
                   status.error_message().c_str());
        }
      },
      holder);
  if (error) *error = BrokerError::kOk;
  return channel;
}

}  // namespace agent
}  // namespace usb_broker
