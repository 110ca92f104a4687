#pragma once
/**
 * VirtualUsbDevice: 租到的远端设备在本地的代理
 *
 * 所有本地传输请求经 Session 转发到 Export Agent. 会话结束后设备
 * 进入故障态 (fault != kOk), 之后的每次传输立即以该故障返回.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common.pb.h"
#include "session.pb.h"
#include "usb_broker/common/error.hpp"
#include "usb_broker/transport/session.hpp"

namespace usb_broker {
namespace agent {

class VirtualUsbDevice {
public:
  VirtualUsbDevice(std::string handle, std::string device_id,
                   broker::v1::DeviceDescriptor descriptor,
                   std::shared_ptr<transport::Session> session,
                   std::chrono::milliseconds default_timeout);

  VirtualUsbDevice(const VirtualUsbDevice &) = delete;
  VirtualUsbDevice &operator=(const VirtualUsbDevice &) = delete;

  /// 异步提交; timeout_ms 为 0 时使用默认超时
  std::future<transport::TransferResult> Submit(broker::v1::TransferFrame frame,
                                                uint64_t *sequence = nullptr);

  /// 同步传输. 超过 timeout 仍无完成帧时放弃该请求并返回 TIMEOUT.
  transport::TransferResult Transfer(broker::v1::TransferFrame frame);

  transport::TransferResult ControlTransfer(uint8_t request_type,
                                            uint8_t request, uint16_t value,
                                            uint16_t index,
                                            const std::string &data_out,
                                            uint16_t length,
                                            uint32_t timeout_ms = 0);
  transport::TransferResult BulkTransfer(uint8_t endpoint,
                                         const std::string &data_out,
                                         uint32_t length,
                                         uint32_t timeout_ms = 0);
  transport::TransferResult InterruptTransfer(uint8_t endpoint,
                                              const std::string &data_out,
                                              uint32_t length,
                                              uint32_t timeout_ms = 0);

  /// 第一次设置的故障生效, 之后的调用被忽略
  void SetFault(BrokerError fault);
  BrokerError fault() const;
  bool IsOperational() const;

  const std::string &handle() const { return handle_; }
  const std::string &device_id() const { return device_id_; }
  const broker::v1::DeviceDescriptor &descriptor() const { return descriptor_; }
  std::shared_ptr<transport::Session> session() const { return session_; }

private:
  transport::TransferResult FaultResult() const;

  std::string handle_;
  std::string device_id_;
  broker::v1::DeviceDescriptor descriptor_;
  std::shared_ptr<transport::Session> session_;
  std::chrono::milliseconds default_timeout_;

  mutable std::mutex mutex_;
  BrokerError fault_{BrokerError::kOk};
};

/// 虚拟设备的发布目标 (本地 USB 子系统或等价抽象层)
class VirtualDeviceHost {
public:
  virtual ~VirtualDeviceHost() = default;

  virtual BrokerError Publish(std::shared_ptr<VirtualUsbDevice> device) = 0;
  virtual void Withdraw(const std::string &handle) = 0;
};

/// 默认实现: 进程内设备表, 供 ImportService 查询
class LocalDeviceTable : public VirtualDeviceHost {
public:
  BrokerError Publish(std::shared_ptr<VirtualUsbDevice> device) override;
  void Withdraw(const std::string &handle) override;

  std::shared_ptr<VirtualUsbDevice> Find(const std::string &handle) const;
  std::vector<std::shared_ptr<VirtualUsbDevice>> List() const;
  size_t Size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<VirtualUsbDevice>> devices_;
};

}  // namespace agent
}  // namespace usb_broker
