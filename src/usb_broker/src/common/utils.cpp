#include "usb_broker/common/utils.hpp"
#include "usb_broker/common/log.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unistd.h>

#include <google/protobuf/timestamp.pb.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace usb_broker {

namespace {

std::string ToHex(const unsigned char *data, size_t len) {
  std::ostringstream oss;
  for (size_t i = 0; i < len; ++i)
    oss << std::hex << std::setfill('0') << std::setw(2)
        << static_cast<int>(data[i]);
  return oss.str();
}

} // namespace

// ──────────────── 密码学 ────────────────

std::string ComputeSHA256FromBytes(const void *data, size_t len) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(static_cast<const unsigned char *>(data), len, hash);
  return ToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string ComputeHmacSha256Hex(const std::string &key,
                                 const std::string &message) {
  unsigned char mac[EVP_MAX_MD_SIZE];
  unsigned int mac_len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char *>(message.data()),
           message.size(), mac, &mac_len) == nullptr) {
    LogError("HMAC-SHA256 computation failed");
    return "";
  }
  return ToHex(mac, mac_len);
}

bool SecureEquals(const std::string &a, const std::string &b) {
  if (a.size() != b.size()) return false;
  if (a.empty()) return true;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string RandomHex(size_t num_bytes) {
  std::vector<unsigned char> buf(num_bytes);
  if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
    LogError("RAND_bytes failed");
    return "";
  }
  return ToHex(buf.data(), buf.size());
}

std::string HostSignaturePayload(const std::string &host_id,
                                 const std::string &address,
                                 int64_t timestamp) {
  return host_id + "\n" + address + "\n" + std::to_string(timestamp);
}

// ──────────────── 标识符校验 ────────────────

bool IsValidHostId(const std::string &host_id) {
  if (host_id.empty() || host_id.size() > 64) return false;
  for (char c : host_id) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' &&
        c != '_' && c != '.') {
      return false;
    }
  }
  return true;
}

bool IsValidBusPath(const std::string &bus_path) {
  if (bus_path.empty() || bus_path.size() > 32) return false;
  if (!std::isdigit(static_cast<unsigned char>(bus_path[0]))) return false;
  for (char c : bus_path) {
    if (!std::isdigit(static_cast<unsigned char>(c)) && c != '-' && c != '.') {
      return false;
    }
  }
  return true;
}

// ──────────────── 系统工具 ────────────────

std::string GetHostname() {
  char buf[256] = {};
  if (gethostname(buf, sizeof(buf) - 1) != 0) return "unknown";
  return buf;
}

int64_t UnixSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// ──────────────── 时间 ────────────────

std::string NowISO8601() {
  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);
  struct tm tm_buf;
  gmtime_r(&time_t_now, &tm_buf);
  char buf[64];
  strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
  return buf;
}

void ToProtoTimestamp(std::chrono::system_clock::time_point tp,
                      google::protobuf::Timestamp *out) {
  if (out == nullptr) return;
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      tp.time_since_epoch())
                      .count();
  out->set_seconds(ns / 1000000000LL);
  out->set_nanos(static_cast<int32_t>(ns % 1000000000LL));
}

void ToProtoTimestamp(std::chrono::steady_clock::time_point tp,
                      google::protobuf::Timestamp *out) {
  // steady → system: 以当前两个时钟的差值换算
  const auto delta = tp - std::chrono::steady_clock::now();
  ToProtoTimestamp(
      std::chrono::system_clock::now() +
          std::chrono::duration_cast<std::chrono::system_clock::duration>(delta),
      out);
}

// ──────────────── 文件操作 ────────────────

bool FileExists(const std::string &path) {
  return access(path.c_str(), F_OK) == 0;
}

std::string ReadFileToString(const std::string &path) {
  std::ifstream ifs(path);
  if (!ifs) return "";
  return std::string(std::istreambuf_iterator<char>(ifs),
                     std::istreambuf_iterator<char>());
}

std::string TrimWhitespace(const std::string &s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

// ──────────────── 请求标识 ────────────────

std::string NewRequestId() {
  static std::atomic<uint64_t> counter{0};
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  char buf[48];
  std::snprintf(buf, sizeof(buf), "req-%012lx-%06lx-%d",
                static_cast<unsigned long>(now_ms),
                static_cast<unsigned long>(counter.fetch_add(1)),
                static_cast<int>(getpid()));
  return buf;
}

} // namespace usb_broker
