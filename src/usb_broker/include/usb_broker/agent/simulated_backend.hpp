#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "usb_broker/agent/device_backend.hpp"

namespace usb_broker {
namespace agent {

/**
 * 合成设备后端 (无硬件环境 / 测试).
 *
 * - 控制传输: GET_DESCRIPTOR(DEVICE) 返回 18 字节设备描述符,
 *   GET_STATUS 返回 0, 其余 OUT 请求成功, 其余 IN 请求 STALL
 * - bulk / interrupt: 按端点号回环, OUT 写入的数据由同号 IN 端点读出;
 *   IN 在 timeout_ms 内无数据则 TIMEOUT
 * - Plug / Unplug 触发热插拔回调
 */
class SimulatedDeviceBackend : public DeviceBackend {
public:
  explicit SimulatedDeviceBackend(
      const std::vector<SimulatedDeviceSpec> &devices = {});
  ~SimulatedDeviceBackend() override;

  std::string Name() const override { return "simulated"; }

  std::vector<broker::v1::DeviceDescriptor> Enumerate() override;
  BrokerError Claim(const std::string &bus_path) override;
  BrokerError Release(const std::string &bus_path) override;
  broker::v1::TransferFrame
  Transfer(const std::string &bus_path,
           const broker::v1::TransferFrame &submit) override;
  bool StartHotplug(HotplugCallback callback) override;
  void StopHotplug() override;

  void Plug(const SimulatedDeviceSpec &spec);
  void Unplug(const std::string &bus_path);

  bool IsClaimed(const std::string &bus_path) const;

  /// 每次传输前随机等待 [0, max_ms] 毫秒, 模拟设备响应抖动
  void SetTransferJitter(uint32_t max_ms) { jitter_ms_.store(max_ms); }

  /// 已执行的 submit (按执行顺序)
  std::vector<broker::v1::TransferFrame> TransferLog(const std::string &bus_path) const;

  static broker::v1::DeviceDescriptor
  DescriptorFromSpec(const SimulatedDeviceSpec &spec, uint32_t devnum);

private:
  struct SimDevice {
    broker::v1::DeviceDescriptor descriptor;
    bool claimed{false};
    bool present{true};
    std::map<uint32_t, std::deque<std::string>> loopback;  // 端点号 → 数据块
    std::vector<broker::v1::TransferFrame> log;
  };

  broker::v1::TransferFrame
  ControlLocked(SimDevice &dev, const broker::v1::TransferFrame &submit);

  mutable std::mutex mutex_;
  std::condition_variable data_cv_;
  std::map<std::string, SimDevice> devices_;
  uint32_t next_devnum_{2};

  std::mutex hotplug_mutex_;
  HotplugCallback hotplug_;

  std::atomic<uint32_t> jitter_ms_{0};
};

}  // namespace agent
}  // namespace usb_broker
