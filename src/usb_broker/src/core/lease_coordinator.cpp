#include "usb_broker/core/lease_coordinator.hpp"
#include "usb_broker/core/event_buffer.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"

#include <algorithm>
#include <cstdlib>

namespace usb_broker {
namespace core {

namespace {

std::string MakeToken(const std::string &device_id, uint64_t generation) {
  return device_id + "#" + std::to_string(generation) + "." + RandomHex(8);
}

bool TokenMatches(const LeaseRecord &lease, const std::string &token) {
  return SecureEquals(lease.token, token);
}

}  // namespace

LeaseCoordinator::LeaseCoordinator(std::shared_ptr<DeviceRegistry> registry,
                                   const LeaseOptions &options)
    : registry_(std::move(registry)), options_(options) {
  // 设备拔出 / host 失联时由 registry 在设备锁内回调
  registry_->SetLeaseTerminator(
      [this](DeviceRecord &rec, LeaseEndReason reason,
             const std::string &detail) { EndLeaseLocked(rec, reason, detail); });
}

LeaseCoordinator::~LeaseCoordinator() {
  registry_->SetLeaseTerminator(nullptr);
}

void LeaseCoordinator::SetListener(std::shared_ptr<LeaseListener> listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

std::shared_ptr<LeaseListener> LeaseCoordinator::listener() const {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  return listener_;
}

void LeaseCoordinator::Emit(broker::v1::EventType type,
                            broker::v1::EventSeverity severity,
                            const std::string &device_id,
                            const std::string &title,
                            const std::string &description) {
  if (event_buffer_) {
    event_buffer_->AddEvent(type, severity, device_id, title, description);
  }
}

std::chrono::milliseconds
LeaseCoordinator::ClampTtl(std::chrono::milliseconds requested) const {
  if (requested.count() <= 0) {
    return std::chrono::milliseconds(options_.default_ttl_ms);
  }
  const auto lo = std::chrono::milliseconds(options_.min_ttl_ms);
  const auto hi = std::chrono::milliseconds(options_.max_ttl_ms);
  return std::min(std::max(requested, lo), hi);
}

bool LeaseCoordinator::ParseToken(const std::string &token,
                                  std::string *device_id,
                                  uint64_t *generation) {
  const auto hash = token.rfind('#');
  if (hash == std::string::npos || hash == 0) return false;
  const auto dot = token.find('.', hash + 1);
  if (dot == std::string::npos || dot == hash + 1 || dot + 1 >= token.size()) {
    return false;
  }
  const std::string gen_str = token.substr(hash + 1, dot - hash - 1);
  if (gen_str.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  if (device_id) *device_id = token.substr(0, hash);
  if (generation) *generation = std::strtoull(gen_str.c_str(), nullptr, 10);
  return true;
}

// ──────────────── 状态迁移 (均在设备锁内) ────────────────

void LeaseCoordinator::FreeLocked(DeviceRecord &rec, const std::string &why) {
  rec.state = broker::v1::DEVICE_STATE_FREE;
  rec.state_since = std::chrono::steady_clock::now();
  LogInfo("Lease: %s is free (%s)", rec.device_id.c_str(), why.c_str());
  Emit(broker::v1::EVENT_TYPE_DEVICE_FREED, broker::v1::EVENT_SEVERITY_INFO,
       rec.device_id, "Device available", why);
}

void LeaseCoordinator::EndLeaseLocked(DeviceRecord &rec, LeaseEndReason reason,
                                      const std::string &detail) {
  if (!rec.lease) return;

  const LeaseRecord ended = *rec.lease;
  rec.lease.reset();
  rec.last_token = ended.token;
  rec.last_end_reason = reason;

  switch (reason) {
    case LeaseEndReason::kReleased:
      Emit(broker::v1::EVENT_TYPE_LEASE_RELEASED,
           broker::v1::EVENT_SEVERITY_INFO, rec.device_id, "Lease released",
           ended.consumer_id);
      break;
    case LeaseEndReason::kExpired:
      Emit(broker::v1::EVENT_TYPE_LEASE_EXPIRED,
           broker::v1::EVENT_SEVERITY_WARNING, rec.device_id, "Lease expired",
           ended.consumer_id);
      break;
    default:
      Emit(broker::v1::EVENT_TYPE_LEASE_REVOKED,
           broker::v1::EVENT_SEVERITY_WARNING, rec.device_id, "Lease revoked",
           ended.consumer_id + ": " + ToString(reason) +
               (detail.empty() ? "" : " (" + detail + ")"));
      break;
  }
  LogInfo("Lease: %s gen=%llu ended for %s (%s)", rec.device_id.c_str(),
          static_cast<unsigned long long>(ended.generation),
          ended.consumer_id.c_str(), ToString(reason));

  // 拔出 / 失联: 状态由 registry 置为 UNREACHABLE
  if (reason == LeaseEndReason::kReleased ||
      reason == LeaseEndReason::kExpired ||
      reason == LeaseEndReason::kRevoked) {
    if (ended.session_active) {
      rec.state = broker::v1::DEVICE_STATE_BOUND;
      rec.state_since = std::chrono::steady_clock::now();
    } else {
      FreeLocked(rec, ToString(reason));
    }
  }

  if (auto l = listener()) {
    l->OnLeaseEnded(rec, ended, reason, detail);
  }
}

bool LeaseCoordinator::RefreshLocked(DeviceRecord &rec,
                                     std::chrono::steady_clock::time_point now) {
  if (rec.lease && now >= rec.lease->expires_at) {
    EndLeaseLocked(rec, LeaseEndReason::kExpired, "ttl elapsed");
    return true;
  }
  if (rec.state == broker::v1::DEVICE_STATE_BOUND &&
      now - rec.state_since >=
          std::chrono::milliseconds(options_.unbind_timeout_ms)) {
    LogWarn("Lease: %s unbind not confirmed within %u ms",
            rec.device_id.c_str(), options_.unbind_timeout_ms);
    FreeLocked(rec, "unbind timeout");
  }
  return false;
}

// ──────────────── 公共操作 ────────────────

BrokerError LeaseCoordinator::Acquire(const std::string &device_id,
                                      const std::string &consumer_id,
                                      std::chrono::milliseconds ttl,
                                      LeaseRecord *lease) {
  if (consumer_id.empty()) return BrokerError::kInvalidArgument;
  const auto effective_ttl = ClampTtl(ttl);

  return registry_->WithDevice(device_id, [&](DeviceRecord &rec) {
    const auto now = std::chrono::steady_clock::now();
    RefreshLocked(rec, now);

    switch (rec.state) {
      case broker::v1::DEVICE_STATE_UNREACHABLE:
        return BrokerError::kUnreachable;
      case broker::v1::DEVICE_STATE_LEASED:
      case broker::v1::DEVICE_STATE_BOUND:
        LogDebug("Lease: %s busy, %s rejected", device_id.c_str(),
                 consumer_id.c_str());
        return BrokerError::kBusy;
      default:
        break;
    }

    LeaseRecord granted;
    granted.generation = ++rec.last_generation;
    granted.token = MakeToken(device_id, granted.generation);
    granted.consumer_id = consumer_id;
    granted.ttl = effective_ttl;
    granted.expires_at = now + effective_ttl;
    granted.acquired_at = std::chrono::system_clock::now();

    rec.lease = granted;
    rec.state = broker::v1::DEVICE_STATE_LEASED;
    rec.state_since = now;

    LogInfo("Lease: %s granted to %s gen=%llu ttl=%lldms", device_id.c_str(),
            consumer_id.c_str(),
            static_cast<unsigned long long>(granted.generation),
            static_cast<long long>(effective_ttl.count()));
    Emit(broker::v1::EVENT_TYPE_LEASE_GRANTED, broker::v1::EVENT_SEVERITY_INFO,
         device_id, "Lease granted", consumer_id);

    if (auto l = listener()) {
      l->OnLeaseGranted(rec, granted);
    }
    if (lease) *lease = granted;
    return BrokerError::kOk;
  });
}

BrokerError LeaseCoordinator::Renew(const std::string &lease_token,
                                    LeaseRecord *lease) {
  std::string device_id;
  if (!ParseToken(lease_token, &device_id, nullptr)) {
    return BrokerError::kInvalidToken;
  }

  const BrokerError err = registry_->WithDevice(device_id, [&](DeviceRecord &rec) {
    const auto now = std::chrono::steady_clock::now();
    RefreshLocked(rec, now);

    if (rec.lease && TokenMatches(*rec.lease, lease_token)) {
      // 只延长, 不缩短
      rec.lease->expires_at = std::max(rec.lease->expires_at, now + rec.lease->ttl);
      if (lease) *lease = *rec.lease;
      return BrokerError::kOk;
    }

    const BrokerError reject =
        (SecureEquals(rec.last_token, lease_token) &&
         rec.last_end_reason == LeaseEndReason::kExpired)
            ? BrokerError::kExpired
            : BrokerError::kInvalidToken;
    Emit(broker::v1::EVENT_TYPE_LEASE_RENEW_REJECTED,
         broker::v1::EVENT_SEVERITY_WARNING, device_id, "Renew rejected",
         ToString(reject));
    return reject;
  });

  // 设备已被清除, 令牌必然失效
  if (err == BrokerError::kNotFound) return BrokerError::kInvalidToken;
  if (err != BrokerError::kOk) {
    LogWarn("Lease: renew %s rejected: %s", device_id.c_str(), ToString(err));
  }
  return err;
}

BrokerError LeaseCoordinator::Release(const std::string &lease_token) {
  std::string device_id;
  if (!ParseToken(lease_token, &device_id, nullptr)) {
    return BrokerError::kInvalidToken;
  }

  const BrokerError err = registry_->WithDevice(device_id, [&](DeviceRecord &rec) {
    RefreshLocked(rec, std::chrono::steady_clock::now());
    if (!rec.lease || !TokenMatches(*rec.lease, lease_token)) {
      return BrokerError::kInvalidToken;
    }
    EndLeaseLocked(rec, LeaseEndReason::kReleased, "");
    return BrokerError::kOk;
  });
  return err == BrokerError::kNotFound ? BrokerError::kInvalidToken : err;
}

BrokerError LeaseCoordinator::Revoke(const std::string &device_id,
                                     const std::string &reason,
                                     std::string *revoked_consumer) {
  return registry_->WithDevice(device_id, [&](DeviceRecord &rec) {
    RefreshLocked(rec, std::chrono::steady_clock::now());

    if (rec.lease) {
      if (revoked_consumer) *revoked_consumer = rec.lease->consumer_id;
      LogWarn("Lease: revoking %s from %s (%s)", device_id.c_str(),
              rec.lease->consumer_id.c_str(), reason.c_str());
      EndLeaseLocked(rec, LeaseEndReason::kRevoked, reason);
      return BrokerError::kOk;
    }
    if (rec.state == broker::v1::DEVICE_STATE_BOUND) {
      LogWarn("Lease: forcing %s out of bound state (%s)", device_id.c_str(),
              reason.c_str());
      FreeLocked(rec, "revoked: " + reason);
      return BrokerError::kOk;
    }
    return BrokerError::kAlreadyFree;
  });
}

BrokerError LeaseCoordinator::OnSessionState(const std::string &device_id,
                                             const std::string &lease_token,
                                             bool active,
                                             const std::string &end_detail) {
  return registry_->WithDevice(device_id, [&](DeviceRecord &rec) {
    RefreshLocked(rec, std::chrono::steady_clock::now());
    const bool current = rec.lease && TokenMatches(*rec.lease, lease_token);

    if (active) {
      if (!current) return BrokerError::kInvalidToken;
      rec.lease->session_active = true;
      Emit(broker::v1::EVENT_TYPE_SESSION_STARTED,
           broker::v1::EVENT_SEVERITY_INFO, device_id, "Session started",
           rec.lease->consumer_id);
      return BrokerError::kOk;
    }

    if (current) {
      rec.lease->session_active = false;
      Emit(broker::v1::EVENT_TYPE_SESSION_ENDED,
           broker::v1::EVENT_SEVERITY_INFO, device_id, "Session ended",
           end_detail.empty() ? rec.lease->consumer_id : end_detail);
      return BrokerError::kOk;
    }
    if (rec.state == broker::v1::DEVICE_STATE_BOUND &&
        SecureEquals(rec.last_token, lease_token)) {
      Emit(broker::v1::EVENT_TYPE_SESSION_ENDED,
           broker::v1::EVENT_SEVERITY_INFO, device_id, "Session ended",
           end_detail.empty() ? std::string("device unbound") : end_detail);
      FreeLocked(rec, "unbound");
      return BrokerError::kOk;
    }
    LogDebug("Lease: stale session-ended notice for %s ignored",
             device_id.c_str());
    return BrokerError::kOk;
  });
}

BrokerError LeaseCoordinator::Validate(const std::string &lease_token) {
  std::string device_id;
  if (!ParseToken(lease_token, &device_id, nullptr)) {
    return BrokerError::kInvalidToken;
  }
  const BrokerError err = registry_->WithDevice(device_id, [&](DeviceRecord &rec) {
    RefreshLocked(rec, std::chrono::steady_clock::now());
    if (rec.lease && TokenMatches(*rec.lease, lease_token)) {
      return BrokerError::kOk;
    }
    if (SecureEquals(rec.last_token, lease_token) &&
        rec.last_end_reason == LeaseEndReason::kExpired) {
      return BrokerError::kExpired;
    }
    return BrokerError::kInvalidToken;
  });
  return err == BrokerError::kNotFound ? BrokerError::kInvalidToken : err;
}

size_t LeaseCoordinator::SweepExpired() {
  size_t expired = 0;
  const auto now = std::chrono::steady_clock::now();
  for (const auto &id : registry_->DeviceIds()) {
    registry_->WithDevice(id, [&](DeviceRecord &rec) {
      if (RefreshLocked(rec, now)) ++expired;
      return BrokerError::kOk;
    });
  }
  if (expired > 0) {
    LogInfo("Lease: sweep expired %zu lease(s)", expired);
  }
  return expired;
}

void FillLease(const std::string &device_id, const LeaseRecord &lease,
               broker::v1::Lease *out) {
  if (out == nullptr) return;
  out->set_lease_token(lease.token);
  out->set_device_id(device_id);
  out->set_consumer_id(lease.consumer_id);
  out->set_generation(lease.generation);
  ToProtoTimestamp(lease.acquired_at, out->mutable_acquired_at());
  ToProtoTimestamp(lease.expires_at, out->mutable_expires_at());
  out->mutable_ttl()->set_seconds(lease.ttl.count() / 1000);
  out->mutable_ttl()->set_nanos(
      static_cast<int32_t>((lease.ttl.count() % 1000) * 1000000));
}

}  // namespace core
}  // namespace usb_broker
