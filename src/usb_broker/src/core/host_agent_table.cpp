#include "usb_broker/core/host_agent_table.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"

#include <cstdlib>

namespace usb_broker {
namespace core {

HostAgentTable::HostAgentTable(
    std::unordered_map<std::string, std::string> credentials,
    std::chrono::milliseconds heartbeat_timeout, int max_skew_sec)
    : credentials_(std::move(credentials)),
      heartbeat_timeout_(heartbeat_timeout),
      max_skew_sec_(max_skew_sec) {
  if (credentials_.empty()) {
    LogWarn("HostAgentTable: no host_credentials configured, "
            "accepting unauthenticated host registration");
  }
}

BrokerError HostAgentTable::VerifySignature(const std::string &host_id,
                                            const std::string &address,
                                            int64_t timestamp,
                                            const std::string &signature) const {
  if (credentials_.empty()) return BrokerError::kOk;

  auto it = credentials_.find(host_id);
  if (it == credentials_.end()) {
    LogWarn("HostAgentTable: unknown host %s", host_id.c_str());
    return BrokerError::kUnauthenticated;
  }
  const int64_t skew = std::llabs(UnixSeconds() - timestamp);
  if (skew > max_skew_sec_) {
    LogWarn("HostAgentTable: host %s timestamp skew %llds exceeds %ds",
            host_id.c_str(), static_cast<long long>(skew), max_skew_sec_);
    return BrokerError::kUnauthenticated;
  }
  const std::string expected = ComputeHmacSha256Hex(
      it->second, HostSignaturePayload(host_id, address, timestamp));
  if (expected.empty() || !SecureEquals(expected, signature)) {
    LogWarn("HostAgentTable: bad signature from host %s", host_id.c_str());
    return BrokerError::kUnauthenticated;
  }
  return BrokerError::kOk;
}

BrokerError HostAgentTable::Register(const std::string &host_id,
                                     const std::string &address,
                                     int64_t timestamp,
                                     const std::string &signature,
                                     const std::string &agent_version,
                                     std::string *token, bool *was_known) {
  if (!IsValidHostId(host_id) || address.empty()) {
    return BrokerError::kInvalidArgument;
  }
  const BrokerError auth = VerifySignature(host_id, address, timestamp, signature);
  if (auth != BrokerError::kOk) return auth;

  const std::string new_token = RandomHex(16);
  if (new_token.empty()) return BrokerError::kInternal;

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = hosts_.find(host_id);
  const bool known = it != hosts_.end();
  HostAgentRecord &rec = hosts_[host_id];
  rec.host_id = host_id;
  rec.address = address;
  rec.token = new_token;
  rec.agent_version = agent_version;
  rec.last_heartbeat = std::chrono::steady_clock::now();
  rec.registered_at = std::chrono::system_clock::now();
  rec.reachable = true;
  rec.active_sessions = 0;
  rec.device_ids.clear();

  LogInfo("HostAgentTable: host %s registered at %s (%s)", host_id.c_str(),
          address.c_str(), known ? "re-register" : "new");
  if (token) *token = new_token;
  if (was_known) *was_known = known;
  return BrokerError::kOk;
}

BrokerError HostAgentTable::Authenticate(const std::string &host_id,
                                         const std::string &token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = hosts_.find(host_id);
  if (it == hosts_.end()) return BrokerError::kNotFound;
  if (it->second.token.empty() || !SecureEquals(it->second.token, token)) {
    return BrokerError::kUnauthenticated;
  }
  return BrokerError::kOk;
}

BrokerError HostAgentTable::Heartbeat(const std::string &host_id,
                                      const std::string &token,
                                      uint32_t active_sessions) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = hosts_.find(host_id);
  if (it == hosts_.end()) return BrokerError::kNotFound;
  HostAgentRecord &rec = it->second;
  // 超时后 token 已吊销, agent 必须重新注册并重报设备
  if (rec.token.empty() || !SecureEquals(rec.token, token)) {
    return BrokerError::kUnauthenticated;
  }
  rec.last_heartbeat = std::chrono::steady_clock::now();
  rec.active_sessions = active_sessions;
  rec.reachable = true;
  return BrokerError::kOk;
}

void HostAgentTable::TrackDevice(const std::string &host_id,
                                 const std::string &device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = hosts_.find(host_id);
  if (it != hosts_.end()) it->second.device_ids.insert(device_id);
}

void HostAgentTable::UntrackDevice(const std::string &host_id,
                                   const std::string &device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = hosts_.find(host_id);
  if (it != hosts_.end()) it->second.device_ids.erase(device_id);
}

std::vector<std::string> HostAgentTable::CollectTimedOut() {
  const auto now = std::chrono::steady_clock::now();
  std::vector<std::string> timed_out;

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &kv : hosts_) {
    HostAgentRecord &rec = kv.second;
    if (!rec.reachable) continue;
    if (now - rec.last_heartbeat < heartbeat_timeout_) continue;
    rec.reachable = false;
    rec.token.clear();
    rec.device_ids.clear();
    timed_out.push_back(kv.first);
    LogWarn("HostAgentTable: host %s missed heartbeats for %lld ms",
            kv.first.c_str(),
            static_cast<long long>(
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    now - rec.last_heartbeat).count()));
  }
  return timed_out;
}

bool HostAgentTable::IsReachable(const std::string &host_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = hosts_.find(host_id);
  return it != hosts_.end() && it->second.reachable;
}

std::string HostAgentTable::AddressOf(const std::string &host_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = hosts_.find(host_id);
  return it == hosts_.end() ? std::string() : it->second.address;
}

bool HostAgentTable::Get(const std::string &host_id,
                         HostAgentRecord *out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = hosts_.find(host_id);
  if (it == hosts_.end()) return false;
  if (out) *out = it->second;
  return true;
}

std::vector<HostAgentRecord> HostAgentTable::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<HostAgentRecord> result;
  result.reserve(hosts_.size());
  for (const auto &kv : hosts_) result.push_back(kv.second);
  return result;
}

}  // namespace core
}  // namespace usb_broker
