#include "usb_broker/transport/frame_channel.hpp"

namespace usb_broker {
namespace transport {

void FrameQueue::Push(broker::v1::Frame frame) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    frames_.push_back(std::move(frame));
  }
  cv_.notify_one();
}

RecvStatus FrameQueue::Pop(broker::v1::Frame *frame,
                           std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !frames_.empty(); });
  if (!frames_.empty()) {
    if (frame) *frame = std::move(frames_.front());
    frames_.pop_front();
    return RecvStatus::kFrame;
  }
  return closed_ ? RecvStatus::kClosed : RecvStatus::kTimeout;
}

void FrameQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool FrameQueue::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

InProcessChannel::InProcessChannel(std::shared_ptr<FrameQueue> inbound,
                                   std::shared_ptr<FrameQueue> outbound,
                                   std::shared_ptr<std::atomic<bool>> partitioned,
                                   std::string peer)
    : inbound_(std::move(inbound)),
      outbound_(std::move(outbound)),
      partitioned_(std::move(partitioned)),
      peer_(std::move(peer)) {}

InProcessChannel::~InProcessChannel() { Close(); }

bool InProcessChannel::Send(const broker::v1::Frame &frame) {
  if (outbound_->IsClosed()) return false;
  if (partitioned_->load()) return true;
  outbound_->Push(frame);
  return true;
}

RecvStatus InProcessChannel::Receive(broker::v1::Frame *frame,
                                     std::chrono::milliseconds timeout) {
  return inbound_->Pop(frame, timeout);
}

void InProcessChannel::Close() {
  inbound_->Close();
  outbound_->Close();
}

std::pair<std::shared_ptr<InProcessChannel>, std::shared_ptr<InProcessChannel>>
MakeInProcessChannelPair(const std::string &name) {
  auto to_export = std::make_shared<FrameQueue>();
  auto to_import = std::make_shared<FrameQueue>();
  auto partitioned = std::make_shared<std::atomic<bool>>(false);
  auto import_end = std::make_shared<InProcessChannel>(
      to_import, to_export, partitioned, name + "/export");
  auto export_end = std::make_shared<InProcessChannel>(
      to_export, to_import, partitioned, name + "/import");
  return {import_end, export_end};
}

}  // namespace transport
}  // namespace usb_broker
