#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "broker.pb.h"
#include "usb_broker/common/error.hpp"
#include "usb_broker/transport/frame_channel.hpp"

namespace usb_broker {
namespace agent {

/// Export Agent → broker (RegistryService)
class BrokerLink {
public:
  virtual ~BrokerLink() = default;

  virtual BrokerError RegisterHost(const std::string &host_id,
                                   const std::string &address,
                                   int64_t timestamp,
                                   const std::string &signature,
                                   std::string *host_token) = 0;
  virtual BrokerError Heartbeat(const std::string &host_id,
                                const std::string &host_token,
                                uint32_t attached_devices,
                                uint32_t active_sessions) = 0;
  virtual BrokerError ReportDevice(const std::string &host_id,
                                   const std::string &host_token,
                                   const broker::v1::DeviceDescriptor &descriptor,
                                   std::string *device_id) = 0;
  virtual BrokerError RemoveDevice(const std::string &host_id,
                                   const std::string &host_token,
                                   const std::string &device_id,
                                   const std::string &reason) = 0;
  virtual BrokerError ReportSessionState(const std::string &host_id,
                                         const std::string &host_token,
                                         const std::string &device_id,
                                         const std::string &lease_token,
                                         bool active,
                                         broker::v1::CloseReason end_reason) = 0;

  /// 阻塞读取命令流, 直到流结束 / CancelWatch
  virtual BrokerError
  WatchCommands(const std::string &host_id, const std::string &host_token,
                const std::function<void(const broker::v1::HostCommand &)>
                    &on_command) = 0;
  virtual void CancelWatch() = 0;
};

struct LeaseGrant {
  std::string token;
  std::string device_id;
  uint64_t generation{0};
  std::chrono::milliseconds ttl{0};
  std::string session_address;
};

/// Import Agent → broker (LeaseService + 可用性通知)
class LeaseClient {
public:
  virtual ~LeaseClient() = default;

  virtual BrokerError Acquire(const std::string &device_id,
                              const std::string &consumer_id,
                              std::chrono::milliseconds ttl, LeaseGrant *grant,
                              uint32_t *retry_after_ms) = 0;
  virtual BrokerError Renew(const std::string &lease_token,
                            LeaseGrant *grant) = 0;
  virtual BrokerError Release(const std::string &lease_token) = 0;

  /// 阻塞到收到该设备的 DEVICE_FREED 或超时. 收到通知返回 true.
  virtual bool WaitForAvailability(const std::string &device_id,
                                   std::chrono::milliseconds timeout) = 0;
};

/// Import Agent → Export Agent 的会话通道
class SessionConnector {
public:
  virtual ~SessionConnector() = default;

  virtual std::shared_ptr<transport::FrameChannel>
  Connect(const std::string &address, std::chrono::milliseconds timeout,
          BrokerError *error) = 0;
};

}  // namespace agent
}  // namespace usb_broker
