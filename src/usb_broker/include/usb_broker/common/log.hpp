#pragma once

#include <string>

namespace usb_broker {

// ──────────────── 日志 ────────────────
// Avoid conflict with glog/syslog macros that define INFO, ERROR, DEBUG etc.
enum class LogLevel { kDebug = 0, kInfo, kWarn, kError };

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

// "DEBUG" / "INFO" / "WARN" / "ERROR" (不区分大小写), 其他值回落到 INFO
LogLevel ParseLogLevel(const std::string &name);

// 进程名前缀, 多个守护进程写同一 journal 时便于区分
void SetLogTag(const std::string &tag);

void Log(LogLevel level, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

// Use template wrappers instead of macros to avoid macro conflicts
template <typename... Args>
inline void LogDebug(const char *fmt, Args... args) { Log(LogLevel::kDebug, fmt, args...); }
template <typename... Args>
inline void LogInfo(const char *fmt, Args... args) { Log(LogLevel::kInfo, fmt, args...); }
template <typename... Args>
inline void LogWarn(const char *fmt, Args... args) { Log(LogLevel::kWarn, fmt, args...); }
template <typename... Args>
inline void LogError(const char *fmt, Args... args) { Log(LogLevel::kError, fmt, args...); }

} // namespace usb_broker
