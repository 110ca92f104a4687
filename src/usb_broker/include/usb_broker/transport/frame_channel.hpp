#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "session.pb.h"

namespace usb_broker {
namespace transport {

enum class RecvStatus { kFrame, kTimeout, kClosed };

/// 一条有序、可靠的双向帧通道 (Session 的下层).
/// Send / Receive 可以在不同线程并发调用; Close 可在任意线程调用.
class FrameChannel {
public:
  virtual ~FrameChannel() = default;

  virtual bool Send(const broker::v1::Frame &frame) = 0;
  virtual RecvStatus Receive(broker::v1::Frame *frame,
                             std::chrono::milliseconds timeout) = 0;
  virtual void Close() = 0;
  virtual std::string Peer() const = 0;
};

/// 阻塞帧队列, 关闭后 Pop 先取完剩余帧再返回 kClosed
class FrameQueue {
public:
  void Push(broker::v1::Frame frame);
  RecvStatus Pop(broker::v1::Frame *frame, std::chrono::milliseconds timeout);
  void Close();
  bool IsClosed() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<broker::v1::Frame> frames_;
  bool closed_{false};
};

/// 进程内通道: 测试与单机部署使用.
/// SetPartitioned(true) 模拟网络黑洞 (帧被静默丢弃, 连接不断开).
class InProcessChannel : public FrameChannel {
public:
  InProcessChannel(std::shared_ptr<FrameQueue> inbound,
                   std::shared_ptr<FrameQueue> outbound,
                   std::shared_ptr<std::atomic<bool>> partitioned,
                   std::string peer);
  ~InProcessChannel() override;

  bool Send(const broker::v1::Frame &frame) override;
  RecvStatus Receive(broker::v1::Frame *frame,
                     std::chrono::milliseconds timeout) override;
  void Close() override;
  std::string Peer() const override { return peer_; }

  void SetPartitioned(bool partitioned) { partitioned_->store(partitioned); }

private:
  std::shared_ptr<FrameQueue> inbound_;
  std::shared_ptr<FrameQueue> outbound_;
  std::shared_ptr<std::atomic<bool>> partitioned_;
  std::string peer_;
};

/// (import 端, export 端)
std::pair<std::shared_ptr<InProcessChannel>, std::shared_ptr<InProcessChannel>>
MakeInProcessChannelPair(const std::string &name = "inproc");

}  // namespace transport
}  // namespace usb_broker
