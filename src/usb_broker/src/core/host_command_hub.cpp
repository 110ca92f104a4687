#include "usb_broker/core/host_command_hub.hpp"
#include "usb_broker/common/log.hpp"

namespace usb_broker {
namespace core {

broker::v1::CloseReason ToCloseReason(LeaseEndReason reason) {
  switch (reason) {
    case LeaseEndReason::kReleased:        return broker::v1::CLOSE_REASON_RELEASED;
    case LeaseEndReason::kExpired:         return broker::v1::CLOSE_REASON_LEASE_EXPIRED;
    case LeaseEndReason::kRevoked:         return broker::v1::CLOSE_REASON_REVOKED;
    case LeaseEndReason::kDeviceRemoved:   return broker::v1::CLOSE_REASON_DEVICE_REMOVED;
    case LeaseEndReason::kHostUnreachable: return broker::v1::CLOSE_REASON_REVOKED;
  }
  return broker::v1::CLOSE_REASON_UNSPECIFIED;
}

// ──────────────── HostCommandQueue ────────────────

void HostCommandQueue::Push(broker::v1::HostCommand command) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    if (queue_.size() >= max_size_) {
      LogWarn("HostCommandQueue: overflow, dropping oldest command for %s",
              queue_.front().device_id().c_str());
      queue_.pop_front();
    }
    queue_.push_back(std::move(command));
  }
  cv_.notify_one();
}

bool HostCommandQueue::WaitPop(broker::v1::HostCommand *command,
                               std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
  if (queue_.empty()) return false;
  if (command) *command = std::move(queue_.front());
  queue_.pop_front();
  return true;
}

void HostCommandQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool HostCommandQueue::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

// ──────────────── HostCommandHub ────────────────

HostCommandHub::HostCommandHub(std::shared_ptr<DeviceRegistry> registry)
    : registry_(std::move(registry)) {}

std::shared_ptr<HostCommandQueue>
HostCommandHub::Subscribe(const std::string &host_id) {
  auto queue = std::make_shared<HostCommandQueue>();
  std::shared_ptr<HostCommandQueue> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &slot = queues_[host_id];
    previous = slot;
    slot = queue;
  }
  if (previous) {
    LogInfo("HostCommandHub: host %s re-subscribed, closing old stream",
            host_id.c_str());
    previous->Close();
  }

  // 先挂队列再补发: 期间新授予的租约可能重复下发, 但不会遗漏
  DeviceQuery query;
  query.host_id = host_id;
  for (const auto &rec : registry_->List(query)) {
    if (!rec.lease) continue;
    broker::v1::HostCommand cmd;
    cmd.set_type(broker::v1::HOST_COMMAND_TYPE_START_SESSION);
    cmd.set_device_id(rec.device_id);
    cmd.set_bus_path(rec.descriptor.bus_path());
    cmd.set_lease_token(rec.lease->token);
    cmd.set_consumer_id(rec.lease->consumer_id);
    queue->Push(std::move(cmd));
  }
  return queue;
}

void HostCommandHub::Unsubscribe(const std::string &host_id,
                                 const std::shared_ptr<HostCommandQueue> &queue) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = queues_.find(host_id);
  if (it != queues_.end() && it->second == queue) {
    queues_.erase(it);
  }
  queue->Close();
}

bool HostCommandHub::HasSubscriber(const std::string &host_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queues_.count(host_id) > 0;
}

void HostCommandHub::CloseAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &kv : queues_) kv.second->Close();
  queues_.clear();
}

void HostCommandHub::Dispatch(const std::string &host_id,
                              broker::v1::HostCommand command) {
  std::shared_ptr<HostCommandQueue> queue;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(host_id);
    if (it != queues_.end()) queue = it->second;
  }
  if (!queue) {
    // agent 重新订阅时会补发活跃租约; STOP 丢失由会话心跳兜底
    LogDebug("HostCommandHub: host %s not subscribed, command for %s deferred",
             host_id.c_str(), command.device_id().c_str());
    return;
  }
  queue->Push(std::move(command));
}

void HostCommandHub::OnLeaseGranted(const DeviceRecord &device,
                                    const LeaseRecord &lease) {
  broker::v1::HostCommand cmd;
  cmd.set_type(broker::v1::HOST_COMMAND_TYPE_START_SESSION);
  cmd.set_device_id(device.device_id);
  cmd.set_bus_path(device.descriptor.bus_path());
  cmd.set_lease_token(lease.token);
  cmd.set_consumer_id(lease.consumer_id);
  Dispatch(device.host_id, std::move(cmd));
}

void HostCommandHub::OnLeaseEnded(const DeviceRecord &device,
                                  const LeaseRecord &lease,
                                  LeaseEndReason reason,
                                  const std::string &detail) {
  broker::v1::HostCommand cmd;
  cmd.set_type(broker::v1::HOST_COMMAND_TYPE_STOP_SESSION);
  cmd.set_device_id(device.device_id);
  cmd.set_bus_path(device.descriptor.bus_path());
  cmd.set_lease_token(lease.token);
  cmd.set_consumer_id(lease.consumer_id);
  cmd.set_reason(ToCloseReason(reason));
  cmd.set_detail(detail);
  Dispatch(device.host_id, std::move(cmd));
}

}  // namespace core
}  // namespace usb_broker
