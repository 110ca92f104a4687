#pragma once
/**
 * Session: 一个活跃租约的 USB 帧中继
 *
 * - 同一 (endpoint, direction) 的 submit 按 sequence 严格递增发送,
 *   接收端发现回退即以 PROTOCOL_ERROR 关闭
 * - 两端各自按 heartbeat_interval 发送心跳, 连续 missed_heartbeat_limit
 *   个周期收不到对端心跳即本地拆除 (HEARTBEAT_TIMEOUT), 不依赖 broker
 * - 关闭时所有未完成的 submit 以 CANCELLED 结束, error 按关闭原因分类
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <tuple>

#include "session.pb.h"
#include "usb_broker/common/error.hpp"
#include "usb_broker/transport/frame_channel.hpp"

namespace usb_broker {
namespace transport {

struct TransferResult {
  broker::v1::TransferStatus status{broker::v1::TRANSFER_STATUS_PENDING};
  std::string data;
  uint32_t actual_length{0};
  BrokerError error{BrokerError::kOk};  // 会话层失败的分类
};

struct SessionOptions {
  std::chrono::milliseconds heartbeat_interval{1000};
  uint32_t missed_heartbeat_limit{3};
};

enum class SessionRole { kImport, kExport };

/// CloseReason → 返回给 Import Agent 调用方的错误分类
BrokerError CloseReasonToError(broker::v1::CloseReason reason);
const char *CloseReasonName(broker::v1::CloseReason reason);

/// 后台线程各持有一个 shared_ptr, 会话对象不会在自己的线程上先于循环退出被析构.
/// 必须由 std::make_shared 创建; Start 之后拥有者须 Close 才能释放.
class Session : public std::enable_shared_from_this<Session> {
public:
  /// export 端: 收到一个 submit
  using SubmitHandler = std::function<void(const broker::v1::TransferFrame &)>;
  /// 会话结束 (恰好一次). remote = 对端发起 / 通道断开
  using CloseHandler = std::function<void(broker::v1::CloseReason reason,
                                          const std::string &detail,
                                          bool remote)>;

  Session(std::string session_id, std::shared_ptr<FrameChannel> channel,
          SessionRole role, const SessionOptions &options);
  ~Session();

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  void SetSubmitHandler(SubmitHandler handler) { submit_handler_ = std::move(handler); }
  void SetCloseHandler(CloseHandler handler) { close_handler_ = std::move(handler); }

  /// 启动读线程与心跳线程, 之后不得再修改 handler
  void Start();

  /// import 端: 分配 sequence 并发送; future 在 complete 或会话关闭时就绪
  std::future<TransferResult> Submit(broker::v1::TransferFrame frame,
                                     uint64_t *sequence = nullptr);

  /// import 端: 放弃一个已超时的 submit (之后到达的 complete 被丢弃)
  void Abandon(uint32_t endpoint, broker::v1::Direction direction,
               uint64_t sequence);

  /// export 端: 回送完成帧 (sequence 与 submit 相同)
  bool Complete(const broker::v1::TransferFrame &completion);

  /// 本地发起关闭: 通知对端并拆除
  void Close(broker::v1::CloseReason reason, const std::string &detail);

  /// 等待会话结束
  bool Wait(std::chrono::milliseconds timeout);

  /// join 后台线程 (幂等). 在会话线程内调用时跳过自身
  void Join();

  bool IsOpen() const { return !closed_.load(); }
  broker::v1::CloseReason close_reason() const;
  std::string close_detail() const;
  const std::string &id() const { return id_; }
  size_t pending() const;
  uint64_t heartbeats_received() const { return heartbeats_rx_.load(); }

private:
  using StreamKey = std::tuple<uint32_t, int>;            // endpoint, direction
  using PendingKey = std::tuple<uint32_t, int, uint64_t>;  // + sequence

  void ReaderLoop();
  void HeartbeatLoop();
  void HandleFrame(const broker::v1::Frame &frame);
  void Shutdown(broker::v1::CloseReason reason, const std::string &detail,
                bool notify_peer, bool remote);
  bool SendFrame(const broker::v1::Frame &frame);

  std::string id_;
  std::shared_ptr<FrameChannel> channel_;
  SessionRole role_;
  SessionOptions options_;

  SubmitHandler submit_handler_;
  CloseHandler close_handler_;

  std::mutex send_mutex_;  // 保证 sequence 分配与发送顺序一致
  std::map<StreamKey, uint64_t> tx_sequence_;

  mutable std::mutex state_mutex_;
  std::condition_variable state_cv_;
  std::map<PendingKey, std::promise<TransferResult>> pending_;
  std::map<StreamKey, uint64_t> rx_sequence_;
  std::chrono::steady_clock::time_point last_heartbeat_rx_;
  broker::v1::CloseReason close_reason_{broker::v1::CLOSE_REASON_UNSPECIFIED};
  std::string close_detail_;

  std::atomic<bool> closed_{false};
  std::atomic<bool> started_{false};
  std::atomic<uint64_t> heartbeats_rx_{0};
  uint64_t heartbeat_counter_{0};

  std::mutex join_mutex_;
  std::thread reader_;
  std::thread heartbeat_;
};

}  // namespace transport
}  // namespace usb_broker
