#include "usb_broker/common/log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace usb_broker {

static std::atomic<LogLevel> g_log_level{LogLevel::kInfo};
static std::mutex g_log_mutex;  // 多线程同时写时保证整行输出
static std::string g_log_tag;

void SetLogLevel(LogLevel level) { g_log_level.store(level); }

LogLevel GetLogLevel() { return g_log_level.load(); }

LogLevel ParseLogLevel(const std::string &name) {
  std::string upper(name);
  for (auto &c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  if (upper == "DEBUG") return LogLevel::kDebug;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::kWarn;
  if (upper == "ERROR") return LogLevel::kError;
  return LogLevel::kInfo;
}

void SetLogTag(const std::string &tag) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_log_tag = tag;
}

void Log(LogLevel level, const char *fmt, ...) {
  if (level < g_log_level.load()) return;

  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;
  struct tm tm_buf;
  localtime_r(&time_t_now, &tm_buf);

  const char *level_str = "???";
  FILE *out = stdout;
  switch (level) {
    case LogLevel::kDebug: level_str = "DEBUG"; break;
    case LogLevel::kInfo:  level_str = "INFO";  break;
    case LogLevel::kWarn:  level_str = "WARN";  out = stderr; break;
    case LogLevel::kError: level_str = "ERROR"; out = stderr; break;
  }

  std::lock_guard<std::mutex> lock(g_log_mutex);
  fprintf(out, "%04d-%02d-%02d %02d:%02d:%02d.%03d [%s] ",
          tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
          tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
          static_cast<int>(ms.count()), level_str);
  if (!g_log_tag.empty()) {
    fprintf(out, "%s: ", g_log_tag.c_str());
  }

  va_list args;
  va_start(args, fmt);
  vfprintf(out, fmt, args);
  va_end(args);
  fprintf(out, "\n");
  fflush(out);
}

} // namespace usb_broker
