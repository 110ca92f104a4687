#include "usb_broker/core/device_registry.hpp"
#include "usb_broker/core/event_buffer.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"

#include <algorithm>
#include <cstdio>

namespace usb_broker {
namespace core {

const char *ToString(LeaseEndReason reason) {
  switch (reason) {
    case LeaseEndReason::kReleased:        return "released";
    case LeaseEndReason::kExpired:         return "expired";
    case LeaseEndReason::kRevoked:         return "revoked";
    case LeaseEndReason::kDeviceRemoved:   return "device removed";
    case LeaseEndReason::kHostUnreachable: return "host unreachable";
  }
  return "unknown";
}

const char *DeviceStateName(broker::v1::DeviceState state) {
  switch (state) {
    case broker::v1::DEVICE_STATE_FREE:        return "free";
    case broker::v1::DEVICE_STATE_BOUND:       return "bound";
    case broker::v1::DEVICE_STATE_LEASED:      return "leased";
    case broker::v1::DEVICE_STATE_UNREACHABLE: return "unreachable";
    default:                                   return "unknown";
  }
}

DeviceRegistry::DeviceRegistry(std::chrono::milliseconds purge_grace)
    : purge_grace_(purge_grace) {}

void DeviceRegistry::SetLeaseTerminator(LeaseTerminator terminator) {
  std::lock_guard<std::mutex> lock(terminator_mutex_);
  terminator_ = std::move(terminator);
}

std::string DeviceRegistry::MakeDeviceId(const std::string &host_id,
                                         const std::string &bus_path) {
  return host_id + ":" + bus_path;
}

std::shared_ptr<DeviceRegistry::Slot>
DeviceRegistry::FindSlot(const std::string &device_id) const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  auto it = slots_.find(device_id);
  if (it == slots_.end()) return nullptr;
  return it->second;
}

void DeviceRegistry::Emit(broker::v1::EventType type,
                          broker::v1::EventSeverity severity,
                          const std::string &device_id,
                          const std::string &title,
                          const std::string &description) {
  if (event_buffer_) {
    event_buffer_->AddEvent(type, severity, device_id, title, description);
  }
}

BrokerError DeviceRegistry::Register(
    const std::string &host_id, const broker::v1::DeviceDescriptor &descriptor,
    std::string *device_id, broker::v1::DeviceState *state) {
  if (!IsValidHostId(host_id) || !IsValidBusPath(descriptor.bus_path())) {
    LogWarn("Registry: rejecting device host=%s bus=%s (invalid identifier)",
            host_id.c_str(), descriptor.bus_path().c_str());
    return BrokerError::kInvalidArgument;
  }

  const std::string id = MakeDeviceId(host_id, descriptor.bus_path());
  if (device_id) *device_id = id;

  char ids[16];
  std::snprintf(ids, sizeof(ids), "%04x:%04x", descriptor.vendor_id(),
                descriptor.product_id());

  for (;;) {
    std::shared_ptr<Slot> slot;
    bool created = false;
    {
      std::unique_lock<std::shared_mutex> lock(map_mutex_);
      auto it = slots_.find(id);
      if (it == slots_.end()) {
        slot = std::make_shared<Slot>();
        slot->record.device_id = id;
        slot->record.host_id = host_id;
        slot->record.descriptor = descriptor;
        slot->record.state = broker::v1::DEVICE_STATE_FREE;
        slot->record.state_since = std::chrono::steady_clock::now();
        slots_.emplace(id, slot);
        created = true;
      } else {
        slot = it->second;
      }
    }

    if (created) {
      if (state) *state = broker::v1::DEVICE_STATE_FREE;
      LogInfo("Registry: registered %s (%s %s)", id.c_str(), ids,
              descriptor.product().c_str());
      Emit(broker::v1::EVENT_TYPE_DEVICE_REGISTERED,
           broker::v1::EVENT_SEVERITY_INFO, id, "Device registered",
           std::string(ids) + " " + descriptor.product());
      Emit(broker::v1::EVENT_TYPE_DEVICE_FREED,
           broker::v1::EVENT_SEVERITY_INFO, id, "Device available", "");
      return BrokerError::kOk;
    }

    std::lock_guard<std::mutex> slot_lock(slot->mutex);
    if (slot->purged) continue;  // 刚被 purge, 重新插入

    DeviceRecord &rec = slot->record;
    rec.descriptor = descriptor;
    if (rec.state == broker::v1::DEVICE_STATE_UNREACHABLE) {
      rec.state = broker::v1::DEVICE_STATE_FREE;
      rec.state_since = std::chrono::steady_clock::now();
      rec.removed = false;
      LogInfo("Registry: %s re-registered, back to free", id.c_str());
      Emit(broker::v1::EVENT_TYPE_DEVICE_REGISTERED,
           broker::v1::EVENT_SEVERITY_INFO, id, "Device re-registered",
           std::string(ids) + " " + descriptor.product());
      Emit(broker::v1::EVENT_TYPE_DEVICE_FREED,
           broker::v1::EVENT_SEVERITY_INFO, id, "Device available", "");
    } else {
      LogDebug("Registry: %s already registered (%s)", id.c_str(),
               DeviceStateName(rec.state));
    }
    if (state) *state = rec.state;
    return BrokerError::kOk;
  }
}

BrokerError DeviceRegistry::Deregister(const std::string &device_id,
                                       const std::string &reason) {
  LeaseTerminator terminator;
  {
    std::lock_guard<std::mutex> lock(terminator_mutex_);
    terminator = terminator_;
  }

  return WithDevice(device_id, [&](DeviceRecord &rec) {
    if (rec.state == broker::v1::DEVICE_STATE_UNREACHABLE && rec.removed) {
      return BrokerError::kOk;
    }
    if (rec.lease && terminator) {
      terminator(rec, LeaseEndReason::kDeviceRemoved, reason);
    }
    rec.lease.reset();
    rec.state = broker::v1::DEVICE_STATE_UNREACHABLE;
    rec.state_since = std::chrono::steady_clock::now();
    rec.removed = true;

    LogWarn("Registry: %s removed (%s)", device_id.c_str(), reason.c_str());
    Emit(broker::v1::EVENT_TYPE_DEVICE_REMOVED,
         broker::v1::EVENT_SEVERITY_WARNING, device_id, "Device removed",
         reason);
    return BrokerError::kOk;
  });
}

std::vector<DeviceRecord> DeviceRegistry::List(const DeviceQuery &query) const {
  std::vector<std::shared_ptr<Slot>> snapshot;
  {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    snapshot.reserve(slots_.size());
    for (const auto &kv : slots_) snapshot.push_back(kv.second);
  }

  std::vector<DeviceRecord> result;
  for (const auto &slot : snapshot) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->purged) continue;
    const DeviceRecord &rec = slot->record;
    if (query.state != broker::v1::DEVICE_STATE_UNSPECIFIED &&
        rec.state != query.state) {
      continue;
    }
    if (!query.host_id.empty() && rec.host_id != query.host_id) continue;
    if (query.vendor_id != 0 && rec.descriptor.vendor_id() != query.vendor_id) {
      continue;
    }
    result.push_back(rec);
  }
  std::sort(result.begin(), result.end(),
            [](const DeviceRecord &a, const DeviceRecord &b) {
              return a.device_id < b.device_id;
            });
  return result;
}

BrokerError DeviceRegistry::Get(const std::string &device_id,
                                DeviceRecord *out) const {
  auto slot = FindSlot(device_id);
  if (!slot) return BrokerError::kNotFound;
  std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->purged) return BrokerError::kNotFound;
  if (out) *out = slot->record;
  return BrokerError::kOk;
}

std::vector<std::string> DeviceRegistry::DeviceIds() const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  std::vector<std::string> ids;
  ids.reserve(slots_.size());
  for (const auto &kv : slots_) ids.push_back(kv.first);
  return ids;
}

size_t DeviceRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  return slots_.size();
}

size_t DeviceRegistry::MarkHostUnreachable(const std::string &host_id,
                                           const std::string &reason) {
  LeaseTerminator terminator;
  {
    std::lock_guard<std::mutex> lock(terminator_mutex_);
    terminator = terminator_;
  }

  size_t count = 0;
  for (const auto &id : DeviceIds()) {
    WithDevice(id, [&](DeviceRecord &rec) {
      if (rec.host_id != host_id ||
          rec.state == broker::v1::DEVICE_STATE_UNREACHABLE) {
        return BrokerError::kOk;
      }
      if (rec.lease && terminator) {
        terminator(rec, LeaseEndReason::kHostUnreachable, reason);
      }
      rec.lease.reset();
      rec.state = broker::v1::DEVICE_STATE_UNREACHABLE;
      rec.state_since = std::chrono::steady_clock::now();
      rec.removed = false;
      ++count;
      Emit(broker::v1::EVENT_TYPE_DEVICE_UNREACHABLE,
           broker::v1::EVENT_SEVERITY_WARNING, id, "Device unreachable",
           reason);
      return BrokerError::kOk;
    });
  }
  if (count > 0) {
    LogWarn("Registry: host %s unreachable (%s), %zu device(s) affected",
            host_id.c_str(), reason.c_str(), count);
  }
  return count;
}

size_t DeviceRegistry::PurgeUnreachable() {
  const auto now = std::chrono::steady_clock::now();
  size_t purged = 0;

  std::unique_lock<std::shared_mutex> lock(map_mutex_);
  for (auto it = slots_.begin(); it != slots_.end();) {
    auto &slot = it->second;
    std::lock_guard<std::mutex> slot_lock(slot->mutex);
    const DeviceRecord &rec = slot->record;
    if (rec.state == broker::v1::DEVICE_STATE_UNREACHABLE &&
        now - rec.state_since >= purge_grace_) {
      slot->purged = true;
      LogInfo("Registry: purged %s", rec.device_id.c_str());
      Emit(broker::v1::EVENT_TYPE_DEVICE_PURGED,
           broker::v1::EVENT_SEVERITY_INFO, rec.device_id, "Device purged",
           rec.removed ? "removed" : "host unreachable");
      it = slots_.erase(it);
      ++purged;
    } else {
      ++it;
    }
  }
  return purged;
}

void FillDeviceSummary(const DeviceRecord &record,
                       broker::v1::DeviceSummary *summary) {
  if (summary == nullptr) return;
  summary->set_device_id(record.device_id);
  summary->set_host_id(record.host_id);
  *summary->mutable_device_descriptor() = record.descriptor;
  summary->set_state(record.state);
  summary->set_lease_generation(record.last_generation);
  if (record.lease) {
    summary->set_lease_consumer(record.lease->consumer_id);
    summary->set_session_active(record.lease->session_active);
    ToProtoTimestamp(record.lease->expires_at,
                     summary->mutable_lease_expires_at());
  }
}

}  // namespace core
}  // namespace usb_broker
