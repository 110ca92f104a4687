#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "common.pb.h"

namespace usb_broker {
namespace core {

/// 管理事件环形缓冲: 设备/租约/主机状态变化都会追加一条,
/// AdminService.StreamEvents 先回放再阻塞推送.
///
/// event_id 是定长 20 位十进制的单调序号, 与墙上时钟无关;
/// 游标按 id 相等查找, 找不到 (已被挤出缓冲) 时从最早的事件继续.
class EventBuffer {
public:
  /// 事件时间戳的时钟, 默认 system_clock::now
  using WallClock = std::function<std::chrono::system_clock::time_point()>;

  explicit EventBuffer(size_t max_size = 1000, WallClock clock = nullptr);
  ~EventBuffer();

  /// 启用持久化日志 (append-only JSONL)
  /// @param log_path 日志文件路径 (如 /var/log/usb_broker/events.jsonl)
  /// @param max_bytes 单文件最大字节 (0=无限, 默认 10MB)
  void EnablePersistence(const std::string &log_path,
                         size_t max_bytes = 10 * 1024 * 1024);

  // 添加事件（自动生成 event_id）
  void AddEvent(broker::v1::EventType type,
                broker::v1::EventSeverity severity,
                const std::string &device_id,
                const std::string &title,
                const std::string &description);

  // 获取从 last_event_id 之后的所有事件（回放）
  std::vector<broker::v1::Event> GetEventsSince(const std::string &last_event_id);

  // 获取最新 N 个事件
  std::vector<broker::v1::Event> GetLatestEvents(size_t count);

  // 当前最新事件的 id (空缓冲返回空串), 用作"从现在开始"的游标
  std::string LatestEventId();

  // 阻塞等待 last_event_id 之后的下一条事件
  bool WaitForEventAfter(const std::string &last_event_id,
                         broker::v1::Event *event,
                         std::chrono::milliseconds timeout);

private:
  std::string GenerateEventId();
  size_t NextIndexLocked(const std::string &last_event_id) const;

  /// 将事件序列化为 JSONL 字符串 (纯函数, 无 I/O, 可在 mutex_ 下调用)
  std::string FormatEventLine(const broker::v1::Event &event);
  /// 将字符串写入磁盘日志 (在 mutex_ 外调用, 不阻塞 gRPC 处理线程)
  void PersistLine(const std::string &line);
  /// 日志轮转: 如果超过 max_bytes, 关闭旧文件并重命名
  void RotateLogLocked();

  std::mutex mutex_;             // 保护 buffer_, cv_, next_sequence_
  std::condition_variable cv_;
  std::deque<broker::v1::Event> buffer_;
  size_t max_size_;
  WallClock clock_;
  uint64_t next_sequence_{1};

  // 持久化日志 (persist_mutex_ 独立于 mutex_, 避免磁盘 I/O 阻塞内存操作)
  std::mutex persist_mutex_;
  std::string log_path_;
  size_t log_max_bytes_{0};
  std::ofstream log_stream_;
  size_t log_current_bytes_{0};
};

}  // namespace core
}  // namespace usb_broker
