#include "usb_broker/core/event_buffer.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <utility>

namespace usb_broker {
namespace core {

EventBuffer::EventBuffer(size_t max_size, WallClock clock)
    : max_size_(max_size), clock_(std::move(clock)) {
  if (!clock_) clock_ = [] { return std::chrono::system_clock::now(); };
}

EventBuffer::~EventBuffer() {
  std::lock_guard<std::mutex> lock(persist_mutex_);
  if (log_stream_.is_open()) {
    log_stream_.flush();
    log_stream_.close();
  }
}

void EventBuffer::EnablePersistence(const std::string &log_path,
                                    size_t max_bytes) {
  std::lock_guard<std::mutex> lock(persist_mutex_);
  log_path_ = log_path;
  log_max_bytes_ = max_bytes;

  // 确保目录存在
  std::error_code ec;
  auto parent = std::filesystem::path(log_path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      LogWarn("EventBuffer: cannot create %s: %s", parent.c_str(),
              ec.message().c_str());
    }
  }

  log_stream_.open(log_path, std::ios::app);
  if (log_stream_.is_open()) {
    // 获取当前文件大小
    log_stream_.seekp(0, std::ios::end);
    log_current_bytes_ = static_cast<size_t>(log_stream_.tellp());
    LogInfo("EventBuffer: persisting events to %s", log_path.c_str());
  } else {
    LogError("EventBuffer: failed to open event log %s", log_path.c_str());
  }
}

void EventBuffer::AddEvent(broker::v1::EventType type,
                           broker::v1::EventSeverity severity,
                           const std::string &device_id,
                           const std::string &title,
                           const std::string &description) {
  std::string persist_line;  // 在锁外执行 I/O

  {
    std::lock_guard<std::mutex> lock(mutex_);

    broker::v1::Event event;
    event.set_event_id(GenerateEventId());
    event.set_type(type);
    event.set_severity(severity);
    event.set_device_id(device_id);
    event.set_title(title);
    event.set_description(description);
    ToProtoTimestamp(clock_(), event.mutable_timestamp());

    buffer_.push_back(event);

    // 保持缓冲区大小
    while (buffer_.size() > max_size_) {
      buffer_.pop_front();
    }

    // 在锁内序列化为字符串，锁外写磁盘
    persist_line = FormatEventLine(event);

    cv_.notify_all();
  }
  PersistLine(persist_line);
}

std::vector<broker::v1::Event> EventBuffer::GetEventsSince(
    const std::string &last_event_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<broker::v1::Event> result;
  for (size_t i = NextIndexLocked(last_event_id); i < buffer_.size(); ++i) {
    result.push_back(buffer_[i]);
  }
  return result;
}

std::vector<broker::v1::Event> EventBuffer::GetLatestEvents(size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<broker::v1::Event> result;
  const size_t start = buffer_.size() > count ? buffer_.size() - count : 0;

  for (size_t i = start; i < buffer_.size(); ++i) {
    result.push_back(buffer_[i]);
  }

  return result;
}

std::string EventBuffer::LatestEventId() {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_.empty() ? std::string() : buffer_.back().event_id();
}

bool EventBuffer::WaitForEventAfter(const std::string &last_event_id,
                                    broker::v1::Event *event,
                                    std::chrono::milliseconds timeout) {
  if (event == nullptr) {
    return false;
  }

  size_t cached_idx = 0;  // 缓存 predicate 结果，避免二次 O(N) 扫描

  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [&]() {
        cached_idx = NextIndexLocked(last_event_id);
        return cached_idx < buffer_.size();
      })) {
    return false;
  }

  *event = buffer_[cached_idx];
  return true;
}

std::string EventBuffer::GenerateEventId() {
  char buf[24];  // 20 位十进制 + null
  std::snprintf(buf, sizeof(buf), "%020llu",
                static_cast<unsigned long long>(next_sequence_++));
  return std::string(buf);
}

size_t EventBuffer::NextIndexLocked(const std::string &last_event_id) const {
  if (buffer_.empty()) {
    return buffer_.size();
  }

  if (last_event_id.empty()) {
    return 0;
  }

  for (size_t i = 0; i < buffer_.size(); ++i) {
    if (buffer_[i].event_id() == last_event_id) {
      return i + 1;
    }
  }

  // 游标已不在环形缓冲中, 从最早可用事件继续
  return 0;
}

// ================================================================
//  持久化: 每个事件追加一行 JSONL 到磁盘
// ================================================================

std::string EventBuffer::FormatEventLine(const broker::v1::Event &event) {
  if (log_path_.empty()) return {};

  static const char *sev_names[] = {
      "UNSPECIFIED", "INFO", "WARNING", "ERROR", "CRITICAL"};
  int sev_idx = static_cast<int>(event.severity());
  if (sev_idx < 0 || sev_idx > 4) sev_idx = 0;

  auto append_escaped = [](std::string &out, const std::string &s) {
    for (char c : s) {
      switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n";  break;
        case '\r': out += "\\r";  break;
        default:   out += c;      break;
      }
    }
  };

  std::string line;
  line.reserve(160 + event.title().size() + event.description().size());

  char num_buf[24];
  line += "{\"id\":\"";
  line += event.event_id();
  line += "\",\"ts\":";
  std::snprintf(num_buf, sizeof(num_buf), "%ld",
                static_cast<long>(event.timestamp().seconds()));
  line += num_buf;
  line += ",\"type\":\"";
  line += broker::v1::EventType_Name(event.type());
  line += "\",\"severity\":\"";
  line += sev_names[sev_idx];
  line += "\",\"device\":\"";
  append_escaped(line, event.device_id());
  line += "\",\"title\":\"";
  append_escaped(line, event.title());
  line += "\",\"desc\":\"";
  append_escaped(line, event.description());
  line += "\"}\n";

  return line;
}

void EventBuffer::PersistLine(const std::string &line) {
  if (line.empty()) return;

  std::lock_guard<std::mutex> lock(persist_mutex_);
  if (!log_stream_.is_open()) return;

  if (log_max_bytes_ > 0 && log_current_bytes_ > log_max_bytes_) {
    RotateLogLocked();
    if (!log_stream_.is_open()) return;
  }

  log_stream_ << line;
  if (!log_stream_.good()) {
    LogWarn("EventBuffer: write to %s failed", log_path_.c_str());
    log_stream_.clear();
    return;
  }
  log_current_bytes_ += line.size();
}

void EventBuffer::RotateLogLocked() {
  log_stream_.close();

  // 旧文件重命名: events.jsonl → events.jsonl.1 (只保留一个历史文件)
  const std::string rotated = log_path_ + ".1";
  std::error_code ec;
  std::filesystem::rename(log_path_, rotated, ec);
  if (ec) {
    LogWarn("EventBuffer: rotate %s failed: %s", log_path_.c_str(),
            ec.message().c_str());
  } else {
    log_current_bytes_ = 0;
  }

  log_stream_.open(log_path_, std::ios::app);
  if (!log_stream_.is_open()) {
    LogError("EventBuffer: reopen %s after rotation failed", log_path_.c_str());
  }
}

}  // namespace core
}  // namespace usb_broker
