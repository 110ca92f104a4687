#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "common.pb.h"
#include "usb_broker/common/config.hpp"
#include "usb_broker/common/error.hpp"
#include "usb_broker/core/device_registry.hpp"

namespace usb_broker {
namespace core {

class EventBuffer;

/// 租约生命周期通知 (HostCommandHub 据此向 Export Agent 推送 START/STOP).
/// 在设备锁内回调, 实现方不得回调 DeviceRegistry.
class LeaseListener {
public:
  virtual ~LeaseListener() = default;
  virtual void OnLeaseGranted(const DeviceRecord &device,
                              const LeaseRecord &lease) = 0;
  virtual void OnLeaseEnded(const DeviceRecord &device,
                            const LeaseRecord &lease, LeaseEndReason reason,
                            const std::string &detail) = 0;
};

/**
 * LeaseCoordinator: 每设备独占租约
 *
 * - Acquire 对 DeviceRecord.state 做 FREE → LEASED 的 CAS, 失败立即 BUSY
 * - 严格过期: 过了截止时间的租约不会被 Renew 救回; 任何触及该设备的
 *   操作都会先把它惰性过期, 不依赖 sweep 的节拍
 * - 所有修改都通过 DeviceRegistry::WithDevice 串行化
 */
class LeaseCoordinator {
public:
  LeaseCoordinator(std::shared_ptr<DeviceRegistry> registry,
                   const LeaseOptions &options);
  ~LeaseCoordinator();

  LeaseCoordinator(const LeaseCoordinator &) = delete;
  LeaseCoordinator &operator=(const LeaseCoordinator &) = delete;

  void SetEventBuffer(std::shared_ptr<EventBuffer> event_buffer) {
    event_buffer_ = std::move(event_buffer);
  }
  void SetListener(std::shared_ptr<LeaseListener> listener);

  /// ttl = 0 使用默认值, 其他值裁剪到 [min_ttl, max_ttl]
  BrokerError Acquire(const std::string &device_id,
                      const std::string &consumer_id,
                      std::chrono::milliseconds ttl, LeaseRecord *lease);

  BrokerError Renew(const std::string &lease_token, LeaseRecord *lease);

  BrokerError Release(const std::string &lease_token);

  /// 管理员强制回收. 设备无租约时返回 kAlreadyFree;
  /// 处于 BOUND (解绑卡住) 时直接回到 FREE.
  BrokerError Revoke(const std::string &device_id, const std::string &reason,
                     std::string *revoked_consumer = nullptr);

  /// Export Agent 报告会话建立 / 结束. 会话事件只在这里产生,
  /// end_detail 写入 SESSION_ENDED 事件的 detail.
  BrokerError OnSessionState(const std::string &device_id,
                             const std::string &lease_token, bool active,
                             const std::string &end_detail = std::string());

  /// 令牌当前是否有效 (未过期且为设备的活跃租约)
  BrokerError Validate(const std::string &lease_token);

  /// 周期任务: 过期租约 + BOUND 解绑超时. 返回本轮过期的租约数.
  size_t SweepExpired();

  std::chrono::milliseconds ClampTtl(std::chrono::milliseconds requested) const;

  /// "<device_id>#<generation>.<hex>"
  static bool ParseToken(const std::string &token, std::string *device_id,
                         uint64_t *generation);

private:
  /// 惰性过期 + BOUND 超时, 返回是否过期了一个租约
  bool RefreshLocked(DeviceRecord &rec,
                     std::chrono::steady_clock::time_point now);
  void EndLeaseLocked(DeviceRecord &rec, LeaseEndReason reason,
                      const std::string &detail);
  void FreeLocked(DeviceRecord &rec, const std::string &why);
  std::shared_ptr<LeaseListener> listener() const;
  void Emit(broker::v1::EventType type, broker::v1::EventSeverity severity,
            const std::string &device_id, const std::string &title,
            const std::string &description);

  std::shared_ptr<DeviceRegistry> registry_;
  LeaseOptions options_;
  std::shared_ptr<EventBuffer> event_buffer_;

  mutable std::mutex listener_mutex_;
  std::shared_ptr<LeaseListener> listener_;
};

/// LeaseRecord → broker.v1.Lease
void FillLease(const std::string &device_id, const LeaseRecord &lease,
               broker::v1::Lease *out);

}  // namespace core
}  // namespace usb_broker
