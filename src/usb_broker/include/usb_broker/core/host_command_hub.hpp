#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "broker.pb.h"
#include "usb_broker/core/lease_coordinator.hpp"

namespace usb_broker {
namespace core {

/// 单个 host 的命令队列, 由 WatchHostCommands 流消费
class HostCommandQueue {
public:
  explicit HostCommandQueue(size_t max_size = 1024) : max_size_(max_size) {}

  void Push(broker::v1::HostCommand command);
  bool WaitPop(broker::v1::HostCommand *command,
               std::chrono::milliseconds timeout);
  void Close();
  bool IsClosed() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<broker::v1::HostCommand> queue_;
  size_t max_size_;
  bool closed_{false};
};

/**
 * 租约事件 → Export Agent 命令.
 *   授予  → START_SESSION (claim 设备, 允许 token 对应的会话)
 *   结束  → STOP_SESSION  (携带 CloseReason, agent 拆除会话)
 *
 * 同一 host 的新订阅替换旧订阅 (agent 重连), 订阅时补发活跃租约的
 * START_SESSION, agent 断线期间授予的租约不会丢失.
 */
class HostCommandHub : public LeaseListener {
public:
  explicit HostCommandHub(std::shared_ptr<DeviceRegistry> registry);

  std::shared_ptr<HostCommandQueue> Subscribe(const std::string &host_id);
  void Unsubscribe(const std::string &host_id,
                   const std::shared_ptr<HostCommandQueue> &queue);
  bool HasSubscriber(const std::string &host_id) const;

  /// 关闭全部订阅 (停机)
  void CloseAll();

  void OnLeaseGranted(const DeviceRecord &device,
                      const LeaseRecord &lease) override;
  void OnLeaseEnded(const DeviceRecord &device, const LeaseRecord &lease,
                    LeaseEndReason reason, const std::string &detail) override;

private:
  void Dispatch(const std::string &host_id, broker::v1::HostCommand command);

  std::shared_ptr<DeviceRegistry> registry_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<HostCommandQueue>> queues_;
};

broker::v1::CloseReason ToCloseReason(LeaseEndReason reason);

}  // namespace core
}  // namespace usb_broker
