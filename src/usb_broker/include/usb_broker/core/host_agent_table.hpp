#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "usb_broker/common/error.hpp"

namespace usb_broker {
namespace core {

struct HostAgentRecord {
  std::string host_id;
  std::string address;        // SessionService 地址
  std::string token;          // 当前有效的 host token, 失联后清空
  std::string agent_version;
  std::chrono::steady_clock::time_point last_heartbeat;
  std::chrono::system_clock::time_point registered_at;
  bool reachable{false};
  uint32_t active_sessions{0};
  std::set<std::string> device_ids;
};

/**
 * Host Agent 注册表: HMAC 认证, 心跳, 失联检测.
 *
 * 签名 = hex(HMAC-SHA256(secret, host_id \n address \n timestamp)),
 * timestamp 与本机时钟相差不得超过 max_skew_sec.
 * credentials 为空时接受任意注册 (开发环境).
 */
class HostAgentTable {
public:
  HostAgentTable(std::unordered_map<std::string, std::string> credentials,
                 std::chrono::milliseconds heartbeat_timeout,
                 int max_skew_sec = 300);

  /// @param was_known 该 host 之前是否注册过 (agent 重启)
  BrokerError Register(const std::string &host_id, const std::string &address,
                       int64_t timestamp, const std::string &signature,
                       const std::string &agent_version, std::string *token,
                       bool *was_known);

  BrokerError Authenticate(const std::string &host_id,
                           const std::string &token) const;

  BrokerError Heartbeat(const std::string &host_id, const std::string &token,
                        uint32_t active_sessions);

  void TrackDevice(const std::string &host_id, const std::string &device_id);
  void UntrackDevice(const std::string &host_id, const std::string &device_id);

  /// 心跳超时的 host 标记为不可达并吊销 token, 返回本轮新失联的 host
  std::vector<std::string> CollectTimedOut();

  bool IsReachable(const std::string &host_id) const;
  std::string AddressOf(const std::string &host_id) const;
  bool Get(const std::string &host_id, HostAgentRecord *out) const;
  std::vector<HostAgentRecord> List() const;

  std::chrono::milliseconds heartbeat_timeout() const {
    return heartbeat_timeout_;
  }

private:
  BrokerError VerifySignature(const std::string &host_id,
                              const std::string &address, int64_t timestamp,
                              const std::string &signature) const;

  std::unordered_map<std::string, std::string> credentials_;
  std::chrono::milliseconds heartbeat_timeout_;
  int max_skew_sec_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, HostAgentRecord> hosts_;
};

}  // namespace core
}  // namespace usb_broker
