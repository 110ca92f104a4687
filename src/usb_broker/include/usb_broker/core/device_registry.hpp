#pragma once
/**
 * DeviceRegistry: 设备表 (host agent 上报的物理 USB 设备)
 *
 * 状态机:
 *   (register)    → FREE
 *   FREE          → LEASED       (LeaseCoordinator::Acquire, CAS)
 *   LEASED        → FREE | BOUND (release / expire / revoke; 会话仍在则 BOUND)
 *   BOUND         → FREE         (Export Agent 报告会话结束, 或 unbind 超时)
 *   *             → UNREACHABLE  (deregister / host 心跳超时 / host 重新注册)
 *   UNREACHABLE   → FREE         (grace 期内重新 register)
 *   UNREACHABLE   → (purged)     (grace 期满)
 *
 * 并发: 每个设备一个 Slot (独立 mutex), 所有对同一设备的修改都经由
 * WithDevice() 串行化. map_mutex_ 只保护 slots_ 结构本身, 持有时间极短,
 * 不同设备之间互不阻塞.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common.pb.h"
#include "usb_broker/common/error.hpp"

namespace usb_broker {
namespace core {

class EventBuffer;

enum class LeaseEndReason {
  kReleased,
  kExpired,
  kRevoked,
  kDeviceRemoved,
  kHostUnreachable,
};

const char *ToString(LeaseEndReason reason);

struct LeaseRecord {
  std::string token;
  std::string consumer_id;
  uint64_t generation{0};
  std::chrono::milliseconds ttl{0};
  std::chrono::steady_clock::time_point expires_at;
  std::chrono::system_clock::time_point acquired_at;
  bool session_active{false};  // Export Agent 已报告会话建立
};

struct DeviceRecord {
  std::string device_id;
  std::string host_id;
  broker::v1::DeviceDescriptor descriptor;
  broker::v1::DeviceState state{broker::v1::DEVICE_STATE_FREE};
  std::chrono::steady_clock::time_point state_since;

  std::optional<LeaseRecord> lease;
  uint64_t last_generation{0};  // 设备记录生命周期内单调递增, 从不复用

  // 最近一次结束的租约: 区分 EXPIRED / INVALID_TOKEN, 以及 BOUND 对应的会话
  std::string last_token;
  LeaseEndReason last_end_reason{LeaseEndReason::kReleased};

  bool removed{false};  // true = 物理拔出; false 且 UNREACHABLE = host 失联
};

struct DeviceQuery {
  broker::v1::DeviceState state{broker::v1::DEVICE_STATE_UNSPECIFIED};
  std::string host_id;
  uint32_t vendor_id{0};
};

/// 设备被注销 / host 失联时, 由 LeaseCoordinator 注入的强制结束租约钩子.
/// 在设备锁内调用.
using LeaseTerminator = std::function<void(DeviceRecord &record,
                                           LeaseEndReason reason,
                                           const std::string &detail)>;

class DeviceRegistry {
public:
  explicit DeviceRegistry(std::chrono::milliseconds purge_grace =
                              std::chrono::milliseconds(60000));

  void SetEventBuffer(std::shared_ptr<EventBuffer> event_buffer) {
    event_buffer_ = std::move(event_buffer);
  }

  void SetLeaseTerminator(LeaseTerminator terminator);

  /// "<host_id>:<bus_path>"
  static std::string MakeDeviceId(const std::string &host_id,
                                  const std::string &bus_path);

  /// 幂等: 同一 (host_id, bus_path) 重复注册只更新描述符 / 复活 UNREACHABLE
  BrokerError Register(const std::string &host_id,
                       const broker::v1::DeviceDescriptor &descriptor,
                       std::string *device_id,
                       broker::v1::DeviceState *state = nullptr);

  /// 物理拔出: 强制结束租约, 标记 UNREACHABLE, grace 期后清除
  BrokerError Deregister(const std::string &device_id, const std::string &reason);

  std::vector<DeviceRecord> List(const DeviceQuery &query) const;
  BrokerError Get(const std::string &device_id, DeviceRecord *out) const;

  /// 在设备锁内执行 fn(DeviceRecord &) → BrokerError
  template <typename Fn>
  BrokerError WithDevice(const std::string &device_id, Fn &&fn) {
    for (;;) {
      auto slot = FindSlot(device_id);
      if (!slot) return BrokerError::kNotFound;
      std::lock_guard<std::mutex> lock(slot->mutex);
      if (slot->purged) continue;  // 与 purge 竞争, 重新查找
      return fn(slot->record);
    }
  }

  std::vector<std::string> DeviceIds() const;
  size_t Size() const;

  /// host 心跳超时或重新注册: 其全部设备 → UNREACHABLE
  size_t MarkHostUnreachable(const std::string &host_id,
                             const std::string &reason);

  /// 清除 grace 期满的 UNREACHABLE 设备, 返回清除数量
  size_t PurgeUnreachable();

private:
  struct Slot {
    std::mutex mutex;
    DeviceRecord record;
    bool purged{false};
  };

  std::shared_ptr<Slot> FindSlot(const std::string &device_id) const;
  void Emit(broker::v1::EventType type, broker::v1::EventSeverity severity,
            const std::string &device_id, const std::string &title,
            const std::string &description);

  std::chrono::milliseconds purge_grace_;

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;

  std::mutex terminator_mutex_;
  LeaseTerminator terminator_;

  std::shared_ptr<EventBuffer> event_buffer_;
};

/// DeviceRecord → DeviceSummary (AdminService / ReportDevice 应答)
void FillDeviceSummary(const DeviceRecord &record,
                       broker::v1::DeviceSummary *summary);

const char *DeviceStateName(broker::v1::DeviceState state);

}  // namespace core
}  // namespace usb_broker
