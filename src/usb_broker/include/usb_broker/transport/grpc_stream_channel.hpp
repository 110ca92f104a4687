#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "usb_broker/transport/frame_channel.hpp"

namespace usb_broker {
namespace transport {

/**
 * gRPC 双向流 → FrameChannel.
 *
 * Stream 为 grpc::ServerReaderWriter<Frame, Frame> 或
 * grpc::ClientReaderWriter<Frame, Frame>. 读线程把 Read() 的结果泵入队列,
 * Close() 通过 cancel 回调 (ServerContext/ClientContext::TryCancel) 打断阻塞读.
 * keepalive 持有 stream 所依赖的对象 (ClientContext, grpc::Channel 等),
 * 析构时先 join 读线程再释放.
 *
 * on_read_done (客户端用来 Finish) 在 write_mutex_ 下调用, 不会与 Write 重叠,
 * 调用之后 Send 一律返回 false.
 */
template <typename Stream>
class GrpcStreamChannel : public FrameChannel {
public:
  GrpcStreamChannel(Stream *stream, std::function<void()> cancel,
                    std::string peer,
                    std::function<void()> on_read_done = nullptr,
                    std::shared_ptr<void> keepalive = nullptr)
      : keepalive_(std::move(keepalive)),
        stream_(stream),
        cancel_(std::move(cancel)),
        on_read_done_(std::move(on_read_done)),
        peer_(std::move(peer)),
        inbound_(std::make_shared<FrameQueue>()) {
    reader_ = std::thread([this] { ReadLoop(); });
  }

  ~GrpcStreamChannel() override {
    Close();
    if (reader_.joinable()) reader_.join();
  }

  bool Send(const broker::v1::Frame &frame) override {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) return false;
    if (!stream_->Write(frame)) {
      closed_ = true;
      return false;
    }
    return true;
  }

  RecvStatus Receive(broker::v1::Frame *frame,
                     std::chrono::milliseconds timeout) override {
    return inbound_->Pop(frame, timeout);
  }

  void Close() override {
    {
      std::lock_guard<std::mutex> lock(write_mutex_);
      if (closed_ && cancelled_) return;
      closed_ = true;
      cancelled_ = true;
    }
    if (cancel_) cancel_();
    inbound_->Close();
  }

  std::string Peer() const override { return peer_; }

private:
  void ReadLoop() {
    broker::v1::Frame frame;
    while (stream_->Read(&frame)) {
      inbound_->Push(frame);
    }
    inbound_->Close();
    std::lock_guard<std::mutex> lock(write_mutex_);
    closed_ = true;
    if (on_read_done_) on_read_done_();
  }

  std::shared_ptr<void> keepalive_;
  Stream *stream_;
  std::function<void()> cancel_;
  std::function<void()> on_read_done_;
  std::string peer_;
  std::shared_ptr<FrameQueue> inbound_;

  std::mutex write_mutex_;
  bool closed_{false};
  bool cancelled_{false};
  std::thread reader_;
};

}  // namespace transport
}  // namespace usb_broker
