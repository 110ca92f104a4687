#pragma once

#include <functional>
#include <string>
#include <vector>

#include "common.pb.h"
#include "session.pb.h"
#include "usb_broker/common/config.hpp"
#include "usb_broker/common/error.hpp"

namespace usb_broker {
namespace agent {

struct HotplugEvent {
  enum class Kind { kAttached, kDetached };
  Kind kind{Kind::kAttached};
  std::string bus_path;
  broker::v1::DeviceDescriptor descriptor;  // 仅 kAttached
};

using HotplugCallback = std::function<void(const HotplugEvent &)>;

/**
 * 操作系统 USB 栈抽象: 枚举、独占 claim / 释放、同步传输、热插拔通知.
 * Export Agent 的核心逻辑只依赖此接口.
 */
class DeviceBackend {
public:
  virtual ~DeviceBackend() = default;

  virtual std::string Name() const = 0;

  virtual std::vector<broker::v1::DeviceDescriptor> Enumerate() = 0;

  /// 独占设备 (解除本地驱动绑定). 已被占用返回 kBusy, 不存在返回 kNotFound.
  virtual BrokerError Claim(const std::string &bus_path) = 0;
  virtual BrokerError Release(const std::string &bus_path) = 0;

  /// 同步执行一次传输, 返回填好 status / payload / actual_length 的完成帧.
  /// 同一设备的不同 endpoint 可以并发调用.
  virtual broker::v1::TransferFrame
  Transfer(const std::string &bus_path,
           const broker::v1::TransferFrame &submit) = 0;

  /// 事件驱动的热插拔通知, 回调在后端线程上执行
  virtual bool StartHotplug(HotplugCallback callback) = 0;
  virtual void StopHotplug() = 0;
};

/// filters 为空时接受除 hub (class 9) 之外的全部设备
bool MatchesFilters(const broker::v1::DeviceDescriptor &descriptor,
                    const std::vector<DeviceFilter> &filters);

broker::v1::UsbSpeed ParseUsbSpeed(const std::string &text);

/// 由 setup packet 解析出的控制请求
struct ControlSetup {
  uint8_t request_type{0};
  uint8_t request{0};
  uint16_t value{0};
  uint16_t index{0};
  uint16_t length{0};
};

bool ParseControlSetup(const std::string &setup, ControlSetup *out);
std::string EncodeControlSetup(const ControlSetup &setup);

/// 完成帧骨架: 拷贝 submit 的类型/端点/方向/序号
broker::v1::TransferFrame MakeCompletion(const broker::v1::TransferFrame &submit,
                                         broker::v1::TransferStatus status);

}  // namespace agent
}  // namespace usb_broker
