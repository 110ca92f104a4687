#include "usb_broker/agent/import_agent.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"

#include <algorithm>

namespace usb_broker {
namespace agent {

const char *FaultKindName(FaultKind kind) {
  switch (kind) {
    case FaultKind::kLeaseLost:     return "lease lost";
    case FaultKind::kDeviceRemoved: return "device removed";
    case FaultKind::kUnreachable:   return "unreachable";
  }
  return "unknown";
}

ImportAgent::ImportAgent(const ImportAgentConfig &config,
                         std::shared_ptr<LeaseClient> leases,
                         std::shared_ptr<SessionConnector> connector,
                         std::shared_ptr<VirtualDeviceHost> host)
    : config_(config),
      consumer_id_(config.consumer_id.empty() ? GetHostname() : config.consumer_id),
      leases_(std::move(leases)),
      connector_(std::move(connector)),
      host_(std::move(host)) {}

ImportAgent::~ImportAgent() { Stop(); }

void ImportAgent::Start() {
  stop_.store(false);
  if (!renew_thread_.joinable()) {
    renew_thread_ = std::thread([this] { RenewLoop(); });
  }
  LogInfo("ImportAgent: started as consumer %s (ttl %ums)", consumer_id_.c_str(),
          config_.lease_ttl_ms);
}

void ImportAgent::Stop() {
  std::vector<std::string> handles;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &kv : attachments_) handles.push_back(kv.first);
  }
  for (const auto &h : handles) Detach(h);

  if (stop_.exchange(true)) return;
  cv_.notify_all();
  if (renew_thread_.joinable()) renew_thread_.join();

  // 续约线程退出后剩余的释放请求在此完成
  std::vector<std::string> releases;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    releases.swap(pending_releases_);
  }
  for (const auto &token : releases) ReleaseNow(token);
}

void ImportAgent::SetFaultCallback(FaultCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  fault_callback_ = std::move(callback);
}

void ImportAgent::SleepFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, duration, [this] { return stop_.load(); });
}

std::chrono::milliseconds
ImportAgent::RenewIntervalFor(const LeaseGrant &grant) const {
  std::chrono::milliseconds interval(config_.renew_interval_ms);
  if (interval.count() == 0) {
    const auto ttl = grant.ttl.count() > 0
                         ? grant.ttl
                         : std::chrono::milliseconds(config_.lease_ttl_ms);
    interval = ttl / 3;
  }
  return std::max(interval, std::chrono::milliseconds(50));
}

// ──────────────── Attach / Detach ────────────────

std::shared_ptr<transport::Session>
ImportAgent::OpenSession(const LeaseGrant &grant,
                         broker::v1::DeviceDescriptor *descriptor,
                         BrokerError *error) {
  const auto timeout = std::chrono::milliseconds(config_.session_open_timeout_ms);
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  BrokerError connect_err = BrokerError::kOk;
  auto channel = connector_->Connect(grant.session_address, timeout, &connect_err);
  if (!channel) {
    *error = connect_err == BrokerError::kOk ? BrokerError::kUnreachable : connect_err;
    LogWarn("ImportAgent: cannot reach export agent at %s: %s",
            grant.session_address.c_str(), ToString(*error));
    return nullptr;
  }

  broker::v1::Frame hello;
  hello.mutable_hello()->set_device_id(grant.device_id);
  hello.mutable_hello()->set_lease_token(grant.token);
  hello.mutable_hello()->set_consumer_id(consumer_id_);
  if (!channel->Send(hello)) {
    channel->Close();
    *error = BrokerError::kUnreachable;
    return nullptr;
  }

  broker::v1::Frame frame;
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      LogWarn("ImportAgent: session open on %s timed out", grant.device_id.c_str());
      channel->Close();
      *error = BrokerError::kUnreachable;
      return nullptr;
    }
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const transport::RecvStatus st = channel->Receive(&frame, left);
    if (st == transport::RecvStatus::kTimeout) continue;
    if (st == transport::RecvStatus::kClosed) {
      *error = BrokerError::kUnreachable;
      return nullptr;
    }
    if (frame.has_accept()) break;
    if (frame.has_close()) {
      const auto reason = frame.close().reason();
      LogWarn("ImportAgent: export agent refused session on %s (%s: %s)",
              grant.device_id.c_str(), transport::CloseReasonName(reason),
              frame.close().detail().c_str());
      channel->Close();
      *error = reason == broker::v1::CLOSE_REASON_DEVICE_REMOVED
                   ? BrokerError::kDeviceRemoved
                   : BrokerError::kUnreachable;
      return nullptr;
    }
    // accept 之前不应出现其他帧
    LogWarn("ImportAgent: unexpected frame %d before accept",
            static_cast<int>(frame.body_case()));
    channel->Close();
    *error = BrokerError::kUnreachable;
    return nullptr;
  }

  const auto &accept = frame.accept();
  transport::SessionOptions options;
  options.heartbeat_interval =
      std::chrono::milliseconds(accept.heartbeat_interval_ms());
  options.missed_heartbeat_limit = accept.missed_heartbeat_limit();
  if (descriptor) *descriptor = accept.device_descriptor();
  *error = BrokerError::kOk;
  return std::make_shared<transport::Session>(accept.session_id(), channel,
                                              transport::SessionRole::kImport,
                                              options);
}

BrokerError ImportAgent::Attach(const std::string &device_id,
                                std::string *handle,
                                broker::v1::DeviceDescriptor *descriptor,
                                uint32_t *retry_after_ms) {
  if (device_id.empty() || !handle) return BrokerError::kInvalidArgument;
  if (stop_.load()) return BrokerError::kCancelled;

  LeaseGrant grant;
  uint32_t retry_after = 0;
  BrokerError err = leases_->Acquire(device_id, consumer_id_,
                                     std::chrono::milliseconds(config_.lease_ttl_ms),
                                     &grant, &retry_after);
  if (retry_after_ms) *retry_after_ms = retry_after;
  if (err != BrokerError::kOk) {
    LogInfo("ImportAgent: acquire %s failed: %s", device_id.c_str(), ToString(err));
    return err;
  }
  if (grant.session_address.empty()) {
    LogWarn("ImportAgent: lease on %s carries no session address", device_id.c_str());
    ReleaseNow(grant.token);
    return BrokerError::kUnreachable;
  }

  broker::v1::DeviceDescriptor desc;
  auto session = OpenSession(grant, &desc, &err);
  if (!session) {
    ReleaseNow(grant.token);
    return err;
  }

  std::string local_handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    local_handle = "vusb-" + std::to_string(++next_handle_);
  }
  auto device = std::make_shared<VirtualUsbDevice>(
      local_handle, device_id, desc, session,
      std::chrono::milliseconds(config_.default_transfer_timeout_ms));

  session->SetCloseHandler([this, local_handle](broker::v1::CloseReason reason,
                                                const std::string &detail, bool) {
    OnSessionClosed(local_handle, reason, detail);
  });
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    Attachment &a = attachments_[local_handle];
    a.device = device;
    a.lease = grant;
    a.renew_interval = RenewIntervalFor(grant);
    a.next_renew = now + a.renew_interval;
    a.local_deadline = now + (grant.ttl.count() > 0
                                  ? grant.ttl
                                  : std::chrono::milliseconds(config_.lease_ttl_ms));
  }
  session->Start();

  err = host_->Publish(device);
  if (err != BrokerError::kOk) {
    LogError("ImportAgent: publish %s failed: %s", local_handle.c_str(), ToString(err));
    Detach(local_handle);
    return err;
  }

  *handle = local_handle;
  if (descriptor) *descriptor = desc;
  LogInfo("ImportAgent: %s attached as %s (lease gen %llu, session %s)",
          device_id.c_str(), local_handle.c_str(),
          static_cast<unsigned long long>(grant.generation), session->id().c_str());
  return BrokerError::kOk;
}

BrokerError ImportAgent::AttachWithRetry(const std::string &device_id,
                                         std::string *handle,
                                         broker::v1::DeviceDescriptor *descriptor) {
  const int attempts = std::max(1, config_.attach_retry.max_attempts);
  auto backoff = std::chrono::milliseconds(config_.attach_retry.initial_backoff_ms);
  const auto max_backoff = std::chrono::milliseconds(config_.attach_retry.max_backoff_ms);

  for (int attempt = 1;; ++attempt) {
    uint32_t retry_after = 0;
    const BrokerError err = Attach(device_id, handle, descriptor, &retry_after);
    if (err != BrokerError::kBusy && err != BrokerError::kUnreachable) return err;
    if (attempt >= attempts || stop_.load()) return err;

    const auto wait = (err == BrokerError::kUnreachable && retry_after > 0)
                          ? std::chrono::milliseconds(retry_after)
                          : backoff;
    LogInfo("ImportAgent: %s %s, retrying in %lld ms (attempt %d/%d)",
            device_id.c_str(), ToString(err), static_cast<long long>(wait.count()),
            attempt, attempts);
    if (err == BrokerError::kBusy) {
      if (leases_->WaitForAvailability(device_id, wait)) {
        LogDebug("ImportAgent: %s freed, retrying now", device_id.c_str());
      }
    } else {
      SleepFor(wait);
    }
    backoff = std::min(backoff * 2, max_backoff);
  }
}

BrokerError ImportAgent::Detach(const std::string &handle) {
  Attachment a;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attachments_.find(handle);
    if (it == attachments_.end()) return BrokerError::kNotFound;
    a = it->second;
    attachments_.erase(it);
  }

  a.device->SetFault(BrokerError::kCancelled);
  auto session = a.device->session();
  session->Close(broker::v1::CLOSE_REASON_RELEASED, "detached");
  host_->Withdraw(handle);
  session->Join();

  // 已拆除的租约要么已丢失, 要么已排队释放
  if (!a.torn_down) ReleaseNow(a.lease.token);
  LogInfo("ImportAgent: %s detached (%s)", handle.c_str(), a.device->device_id().c_str());
  return BrokerError::kOk;
}

void ImportAgent::ReleaseNow(const std::string &lease_token) {
  const BrokerError err = leases_->Release(lease_token);
  if (err == BrokerError::kOk) return;
  if (err == BrokerError::kUnreachable) {
    LogWarn("ImportAgent: release failed (broker unreachable), lease will lapse by TTL");
  } else {
    LogDebug("ImportAgent: release returned %s", ToString(err));
  }
}

void ImportAgent::QueueRelease(const std::string &lease_token) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_releases_.push_back(lease_token);
  }
  cv_.notify_all();
}

// ──────────────── 故障 ────────────────

void ImportAgent::NotifyFault(const std::string &handle, FaultKind kind,
                              BrokerError error) {
  LogWarn("ImportAgent: %s faulted: %s (%s)", handle.c_str(), FaultKindName(kind),
          ToString(error));
  FaultCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = fault_callback_;
  }
  if (cb) cb(handle, kind, error);
}

void ImportAgent::OnSessionClosed(const std::string &handle,
                                  broker::v1::CloseReason reason,
                                  const std::string &detail) {
  std::shared_ptr<VirtualUsbDevice> device;
  std::string token;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attachments_.find(handle);
    if (it == attachments_.end() || it->second.torn_down) return;
    it->second.torn_down = true;
    device = it->second.device;
    token = it->second.lease.token;
  }

  FaultKind kind;
  BrokerError error;
  switch (reason) {
    case broker::v1::CLOSE_REASON_DEVICE_REMOVED:
      kind = FaultKind::kDeviceRemoved;
      error = BrokerError::kDeviceRemoved;
      break;
    case broker::v1::CLOSE_REASON_LEASE_EXPIRED:
      kind = FaultKind::kLeaseLost;
      error = BrokerError::kExpired;
      break;
    case broker::v1::CLOSE_REASON_REVOKED:
    case broker::v1::CLOSE_REASON_RELEASED:
      kind = FaultKind::kLeaseLost;
      error = BrokerError::kInvalidToken;
      break;
    default:
      kind = FaultKind::kUnreachable;
      error = BrokerError::kUnreachable;
      break;
  }
  device->SetFault(error);
  LogInfo("ImportAgent: session for %s ended: %s%s%s", handle.c_str(),
          transport::CloseReasonName(reason), detail.empty() ? "" : ": ",
          detail.c_str());

  // 会话线程里不做阻塞 RPC, 交给续约线程
  if (kind != FaultKind::kLeaseLost) QueueRelease(token);
  NotifyFault(handle, kind, error);
}

void ImportAgent::LeaseLost(const std::string &handle, BrokerError error) {
  std::shared_ptr<VirtualUsbDevice> device;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attachments_.find(handle);
    if (it == attachments_.end() || it->second.torn_down) return;
    it->second.torn_down = true;
    device = it->second.device;
  }
  device->SetFault(error);
  device->session()->Close(error == BrokerError::kExpired
                               ? broker::v1::CLOSE_REASON_LEASE_EXPIRED
                               : broker::v1::CLOSE_REASON_REVOKED,
                           "lease lost");
  NotifyFault(handle, FaultKind::kLeaseLost, error);
}

// ──────────────── 续约 ────────────────

void ImportAgent::RenewLoop() {
  while (!stop_.load()) {
    std::vector<std::string> releases;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      auto wake = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
      for (const auto &kv : attachments_) {
        if (!kv.second.torn_down) wake = std::min(wake, kv.second.next_renew);
      }
      cv_.wait_until(lock, wake, [this] {
        return stop_.load() || !pending_releases_.empty();
      });
      if (stop_.load()) break;
      releases.swap(pending_releases_);
    }
    for (const auto &token : releases) ReleaseNow(token);
    RenewDue();
  }
}

void ImportAgent::RenewDue() {
  struct Due {
    std::string handle;
    std::string token;
  };
  std::vector<Due> due;
  const auto now = std::chrono::steady_clock::now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &kv : attachments_) {
      if (!kv.second.torn_down && now >= kv.second.next_renew) {
        due.push_back({kv.first, kv.second.lease.token});
      }
    }
  }

  for (const auto &d : due) {
    LeaseGrant renewed;
    const BrokerError err = leases_->Renew(d.token, &renewed);
    const auto after = std::chrono::steady_clock::now();

    if (err == BrokerError::kExpired || err == BrokerError::kInvalidToken ||
        err == BrokerError::kNotFound) {
      LeaseLost(d.handle, err == BrokerError::kNotFound ? BrokerError::kInvalidToken
                                                        : err);
      continue;
    }

    bool lapsed = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = attachments_.find(d.handle);
      if (it == attachments_.end() || it->second.torn_down) continue;
      Attachment &a = it->second;
      if (err == BrokerError::kOk) {
        const auto ttl = renewed.ttl.count() > 0 ? renewed.ttl : a.lease.ttl;
        a.next_renew = after + a.renew_interval;
        a.local_deadline = after + ttl;
        LogDebug("ImportAgent: renewed %s", d.handle.c_str());
      } else if (after >= a.local_deadline) {
        lapsed = true;
      } else {
        a.next_renew = after + std::min(a.renew_interval,
                                        std::chrono::milliseconds(1000));
        LogWarn("ImportAgent: renew of %s failed (%s), retrying", d.handle.c_str(),
                ToString(err));
      }
    }
    // broker 失联超过 TTL: broker 侧租约必然已过期
    if (lapsed) LeaseLost(d.handle, BrokerError::kExpired);
  }
}

// ──────────────── 传输 / 查询 ────────────────

BrokerError ImportAgent::Transfer(const std::string &handle,
                                  const broker::v1::TransferFrame &frame,
                                  transport::TransferResult *result) {
  auto device = Find(handle);
  if (!device) return BrokerError::kNotFound;
  *result = device->Transfer(frame);
  return result->error;
}

std::shared_ptr<VirtualUsbDevice> ImportAgent::Find(const std::string &handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = attachments_.find(handle);
  return it == attachments_.end() ? nullptr : it->second.device;
}

std::vector<std::shared_ptr<VirtualUsbDevice>> ImportAgent::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<VirtualUsbDevice>> out;
  for (const auto &kv : attachments_) out.push_back(kv.second.device);
  return out;
}

}  // namespace agent
}  // namespace usb_broker
