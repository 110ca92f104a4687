#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "usb_broker/agent/device_backend.hpp"

namespace usb_broker {
namespace agent {

/**
 * Linux 后端:
 *   枚举   /sys/bus/usb/devices/<bus_path>/ 属性
 *   claim  /dev/bus/usb/BBB/DDD + USBDEVFS_DISCONNECT / CLAIMINTERFACE
 *   传输   USBDEVFS_CONTROL / USBDEVFS_BULK (interrupt 端点同样走 BULK)
 *   热插拔 NETLINK_KOBJECT_UEVENT, 只关心 SUBSYSTEM=usb DEVTYPE=usb_device
 */
class LinuxUsbfsBackend : public DeviceBackend {
public:
  explicit LinuxUsbfsBackend(std::string sysfs_root = "/sys/bus/usb/devices",
                             std::string devfs_root = "/dev/bus/usb");
  ~LinuxUsbfsBackend() override;

  std::string Name() const override { return "linux"; }

  std::vector<broker::v1::DeviceDescriptor> Enumerate() override;
  BrokerError Claim(const std::string &bus_path) override;
  BrokerError Release(const std::string &bus_path) override;
  broker::v1::TransferFrame
  Transfer(const std::string &bus_path,
           const broker::v1::TransferFrame &submit) override;
  bool StartHotplug(HotplugCallback callback) override;
  void StopHotplug() override;

  /// 读取单个设备的 sysfs 描述, 设备不存在时返回 false
  bool ReadDescriptor(const std::string &bus_path,
                      broker::v1::DeviceDescriptor *out) const;

private:
  struct ClaimedDevice {
    int fd{-1};
    std::vector<unsigned int> interfaces;
    ~ClaimedDevice();
  };

  std::vector<unsigned int> InterfaceNumbers(const std::string &bus_path) const;
  std::shared_ptr<ClaimedDevice> Find(const std::string &bus_path) const;
  void HotplugLoop();

  std::string sysfs_root_;
  std::string devfs_root_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<ClaimedDevice>> claimed_;

  HotplugCallback hotplug_;
  int netlink_fd_{-1};
  int control_pipe_[2]{-1, -1};
  std::atomic<bool> hotplug_running_{false};
  std::thread hotplug_thread_;
};

}  // namespace agent
}  // namespace usb_broker
