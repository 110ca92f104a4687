#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "broker.grpc.pb.h"
#include "session.grpc.pb.h"
#include "usb_broker/agent/broker_link.hpp"

namespace usb_broker {
namespace agent {

/**
 * broker 的 gRPC 客户端: BrokerLink + LeaseClient + 管理接口.
 *
 * 每个 RPC 都带 rpc_timeout 截止时间. 传输层失败 (UNAVAILABLE /
 * DEADLINE_EXCEEDED) 时用同一个 request_id 重试一次, broker 侧的去重缓存
 * 保证重试拿到与第一次相同的应答.
 */
class BrokerClient : public BrokerLink, public LeaseClient {
public:
  BrokerClient(std::shared_ptr<grpc::Channel> channel,
               std::chrono::milliseconds rpc_timeout);
  ~BrokerClient() override;

  /// root_cert_path 为空时使用明文连接
  static std::shared_ptr<grpc::Channel>
  MakeChannel(const std::string &address, const std::string &root_cert_path);

  // ── BrokerLink ──
  BrokerError RegisterHost(const std::string &host_id,
                           const std::string &address, int64_t timestamp,
                           const std::string &signature,
                           std::string *host_token) override;
  BrokerError Heartbeat(const std::string &host_id,
                        const std::string &host_token,
                        uint32_t attached_devices,
                        uint32_t active_sessions) override;
  BrokerError ReportDevice(const std::string &host_id,
                           const std::string &host_token,
                           const broker::v1::DeviceDescriptor &descriptor,
                           std::string *device_id) override;
  BrokerError RemoveDevice(const std::string &host_id,
                           const std::string &host_token,
                           const std::string &device_id,
                           const std::string &reason) override;
  BrokerError ReportSessionState(const std::string &host_id,
                                 const std::string &host_token,
                                 const std::string &device_id,
                                 const std::string &lease_token, bool active,
                                 broker::v1::CloseReason end_reason) override;
  BrokerError WatchCommands(
      const std::string &host_id, const std::string &host_token,
      const std::function<void(const broker::v1::HostCommand &)> &on_command)
      override;
  void CancelWatch() override;

  // ── LeaseClient ──
  BrokerError Acquire(const std::string &device_id,
                      const std::string &consumer_id,
                      std::chrono::milliseconds ttl, LeaseGrant *grant,
                      uint32_t *retry_after_ms) override;
  BrokerError Renew(const std::string &lease_token, LeaseGrant *grant) override;
  BrokerError Release(const std::string &lease_token) override;
  bool WaitForAvailability(const std::string &device_id,
                           std::chrono::milliseconds timeout) override;

  // ── AdminService ──
  BrokerError ListDevices(const broker::v1::ListDevicesRequest &filter,
                          std::vector<broker::v1::DeviceSummary> *devices,
                          std::string *message = nullptr);
  BrokerError GetDevice(const std::string &device_id,
                        broker::v1::DeviceSummary *device,
                        std::string *message = nullptr);
  BrokerError RevokeDevice(const std::string &device_id,
                           const std::string &reason,
                           std::string *revoked_consumer,
                           std::string *message = nullptr);
  /// on_event 返回 false 时停止; timeout 为 0 表示不设截止时间
  BrokerError StreamEvents(
      const broker::v1::EventStreamRequest &request,
      const std::function<bool(const broker::v1::Event &)> &on_event,
      std::chrono::milliseconds timeout);

private:
  template <typename Request, typename Response, typename Call>
  BrokerError Invoke(const Request &request, Response *response, Call call,
                     const char *name);

  void PrepareBase(broker::v1::RequestBase *base) const;

  std::shared_ptr<grpc::Channel> channel_;
  std::chrono::milliseconds rpc_timeout_;
  std::unique_ptr<broker::v1::RegistryService::Stub> registry_;
  std::unique_ptr<broker::v1::LeaseService::Stub> lease_;
  std::unique_ptr<broker::v1::AdminService::Stub> admin_;

  std::mutex watch_mutex_;
  grpc::ClientContext *watch_context_{nullptr};
  bool watch_cancelled_{false};
};

/// gRPC SessionService 连接器 (Import Agent → Export Agent)
class GrpcSessionConnector : public SessionConnector {
public:
  explicit GrpcSessionConnector(std::string root_cert_path = "")
      : root_cert_path_(std::move(root_cert_path)) {}

  std::shared_ptr<transport::FrameChannel>
  Connect(const std::string &address, std::chrono::milliseconds timeout,
          BrokerError *error) override;

private:
  std::string root_cert_path_;
};

}  // namespace agent
}  // namespace usb_broker
