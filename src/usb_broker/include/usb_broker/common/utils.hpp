#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace google {
namespace protobuf {
class Timestamp;
}
}

namespace usb_broker {

// ──────────────── 密码学 (OpenSSL) ────────────────
std::string ComputeSHA256FromBytes(const void *data, size_t len);

// hex(HMAC-SHA256(key, message))
std::string ComputeHmacSha256Hex(const std::string &key,
                                 const std::string &message);

// 常量时间比较, 用于签名/令牌校验
bool SecureEquals(const std::string &a, const std::string &b);

// RAND_bytes → hex, 失败时返回空串
std::string RandomHex(size_t num_bytes);

// Host Agent 注册签名的规范化消息
std::string HostSignaturePayload(const std::string &host_id,
                                 const std::string &address,
                                 int64_t timestamp);

// ──────────────── 标识符校验 ────────────────
// host_id 只允许 [A-Za-z0-9._-]
bool IsValidHostId(const std::string &host_id);
// sysfs 设备名: 数字, '-' 和 '.'
bool IsValidBusPath(const std::string &bus_path);

// ──────────────── 系统工具 ────────────────
std::string GetHostname();
int64_t UnixSeconds();

// ──────────────── 时间 ────────────────
std::string NowISO8601();

// steady_clock 截止时间 → 墙钟 Timestamp
void ToProtoTimestamp(std::chrono::steady_clock::time_point tp,
                      google::protobuf::Timestamp *out);
void ToProtoTimestamp(std::chrono::system_clock::time_point tp,
                      google::protobuf::Timestamp *out);

// ──────────────── 文件操作 ────────────────
bool FileExists(const std::string &path);
std::string ReadFileToString(const std::string &path);
std::string TrimWhitespace(const std::string &s);

// ──────────────── 请求标识 ────────────────
std::string NewRequestId();

} // namespace usb_broker
