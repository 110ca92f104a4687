#pragma once
/**
 * ImportAgent: 运行在消费者 (测试容器 / VM) 内
 *
 * Attach: AcquireLease → 连接 Export Agent 的 SessionService → hello/accept
 *         → 发布 VirtualUsbDevice, 任一步失败都尽力释放租约
 * 续约线程: 每 renew_interval 调 RenewLease. Expired / InvalidToken 立即
 *         拆除虚拟设备并上报 lease-lost; broker 不可达时持续重试,
 *         直到本地记录的租约截止时间.
 * Detach: 取消所有在途传输, 关闭会话, 尽力释放租约 (失败时由 TTL 兜底)
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "usb_broker/agent/broker_link.hpp"
#include "usb_broker/agent/virtual_device.hpp"
#include "usb_broker/common/config.hpp"

namespace usb_broker {
namespace agent {

enum class FaultKind { kLeaseLost, kDeviceRemoved, kUnreachable };

const char *FaultKindName(FaultKind kind);

class ImportAgent {
public:
  using FaultCallback = std::function<void(const std::string &handle,
                                           FaultKind kind, BrokerError error)>;

  ImportAgent(const ImportAgentConfig &config,
              std::shared_ptr<LeaseClient> leases,
              std::shared_ptr<SessionConnector> connector,
              std::shared_ptr<VirtualDeviceHost> host);
  ~ImportAgent();

  ImportAgent(const ImportAgent &) = delete;
  ImportAgent &operator=(const ImportAgent &) = delete;

  void Start();
  /// 拆除全部已挂载设备并停止续约线程
  void Stop();

  void SetFaultCallback(FaultCallback callback);

  BrokerError Attach(const std::string &device_id, std::string *handle,
                     broker::v1::DeviceDescriptor *descriptor = nullptr,
                     uint32_t *retry_after_ms = nullptr);
  /// Busy / Unreachable 时按 attach_retry 退避, 收到 DEVICE_FREED 提前醒来
  BrokerError AttachWithRetry(const std::string &device_id, std::string *handle,
                              broker::v1::DeviceDescriptor *descriptor = nullptr);
  BrokerError Detach(const std::string &handle);

  BrokerError Transfer(const std::string &handle,
                       const broker::v1::TransferFrame &frame,
                       transport::TransferResult *result);

  std::shared_ptr<VirtualUsbDevice> Find(const std::string &handle) const;
  std::vector<std::shared_ptr<VirtualUsbDevice>> List() const;
  const std::string &consumer_id() const { return consumer_id_; }

private:
  struct Attachment {
    std::shared_ptr<VirtualUsbDevice> device;
    LeaseGrant lease;
    std::chrono::milliseconds renew_interval{0};
    std::chrono::steady_clock::time_point next_renew;
    std::chrono::steady_clock::time_point local_deadline;
    bool torn_down{false};
  };

  std::shared_ptr<transport::Session>
  OpenSession(const LeaseGrant &grant, broker::v1::DeviceDescriptor *descriptor,
              BrokerError *error);
  void OnSessionClosed(const std::string &handle, broker::v1::CloseReason reason,
                       const std::string &detail);
  void LeaseLost(const std::string &handle, BrokerError error);
  void NotifyFault(const std::string &handle, FaultKind kind, BrokerError error);
  void QueueRelease(const std::string &lease_token);
  void ReleaseNow(const std::string &lease_token);
  void RenewLoop();
  void RenewDue();
  std::chrono::milliseconds RenewIntervalFor(const LeaseGrant &grant) const;
  void SleepFor(std::chrono::milliseconds duration);

  ImportAgentConfig config_;
  std::string consumer_id_;
  std::shared_ptr<LeaseClient> leases_;
  std::shared_ptr<SessionConnector> connector_;
  std::shared_ptr<VirtualDeviceHost> host_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::string, Attachment> attachments_;  // handle → attachment
  std::vector<std::string> pending_releases_;
  uint64_t next_handle_{0};

  std::mutex callback_mutex_;
  FaultCallback fault_callback_;

  std::atomic<bool> stop_{false};
  std::thread renew_thread_;
};

}  // namespace agent
}  // namespace usb_broker
