#pragma once
/**
 * ExportAgent: 运行在物理持有 USB 设备的机器上
 *
 * 启动: 热插拔监听 → 枚举 (按 device_filters 过滤) → 注册 host → 上报设备
 *       → 订阅 broker 命令流 → host 心跳
 * START_SESSION: claim 设备并授权该租约令牌
 * 会话: 校验 hello 中的令牌 → accept → 逐帧转发到 DeviceBackend,
 *       同一 (endpoint, direction) 串行执行, 不同端点并发
 * 会话结束 (任何原因): 释放 claim, 上报 ReportSessionState(active=false)
 * 设备拔出: 立即以 DEVICE_REMOVED 关闭会话并向 broker 注销
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "usb_broker/agent/broker_link.hpp"
#include "usb_broker/agent/device_backend.hpp"
#include "usb_broker/common/config.hpp"
#include "usb_broker/transport/session.hpp"

namespace usb_broker {
namespace agent {

class ExportAgent {
public:
  ExportAgent(const ExportAgentConfig &config,
              std::shared_ptr<DeviceBackend> backend,
              std::shared_ptr<BrokerLink> link);
  ~ExportAgent();

  ExportAgent(const ExportAgent &) = delete;
  ExportAgent &operator=(const ExportAgent &) = delete;

  void Start();
  void Stop();

  /// 服务一个入站会话通道, 阻塞到会话结束
  void ServeSession(std::shared_ptr<transport::FrameChannel> channel);

  void HandleCommand(const broker::v1::HostCommand &command);
  void HandleHotplug(const HotplugEvent &event);

  bool IsRegistered() const { return registered_.load(); }
  size_t ActiveSessions() const;
  std::vector<std::string> ExportedDevices() const;
  std::string DeviceIdFor(const std::string &bus_path) const;
  const std::string &host_id() const { return config_.host_id; }

  /// 等待注册完成 (测试 / 启动探测)
  bool WaitRegistered(std::chrono::milliseconds timeout) const;

private:
  struct ExportedDevice {
    broker::v1::DeviceDescriptor descriptor;
    std::string device_id;
    bool claimed{false};
    std::string authorized_token;
    std::string consumer_id;
    std::shared_ptr<transport::Session> session;
    std::string session_token;
  };

  void ControlLoop();
  void HeartbeatLoop();
  bool RegisterAndReport();
  void ReportOne(const std::string &bus_path);
  void HandleDeviceRemoved(const std::string &bus_path, const std::string &reason);
  void CloseAllSessions(broker::v1::CloseReason reason, const std::string &detail);
  std::string CurrentToken() const;
  void SleepFor(std::chrono::milliseconds duration);
  void Reject(transport::FrameChannel &channel, broker::v1::CloseReason reason,
              const std::string &detail);

  ExportAgentConfig config_;
  std::shared_ptr<DeviceBackend> backend_;
  std::shared_ptr<BrokerLink> link_;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;  // 授权 / 注册 / 会话退出
  std::map<std::string, ExportedDevice> devices_;  // bus_path → device
  std::string host_token_;
  size_t serving_{0};

  std::atomic<bool> registered_{false};
  std::atomic<bool> stop_{false};
  std::thread control_thread_;
  std::thread heartbeat_thread_;
};

}  // namespace agent
}  // namespace usb_broker
