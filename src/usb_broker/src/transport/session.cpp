#include "usb_broker/transport/session.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"

#include <vector>

namespace usb_broker {
namespace transport {

BrokerError CloseReasonToError(broker::v1::CloseReason reason) {
  switch (reason) {
    case broker::v1::CLOSE_REASON_RELEASED:
    case broker::v1::CLOSE_REASON_SHUTDOWN:
      return BrokerError::kCancelled;
    case broker::v1::CLOSE_REASON_LEASE_EXPIRED:
      return BrokerError::kExpired;
    case broker::v1::CLOSE_REASON_REVOKED:
    case broker::v1::CLOSE_REASON_REJECTED:
      return BrokerError::kInvalidToken;
    case broker::v1::CLOSE_REASON_DEVICE_REMOVED:
      return BrokerError::kDeviceRemoved;
    case broker::v1::CLOSE_REASON_HEARTBEAT_TIMEOUT:
    case broker::v1::CLOSE_REASON_TRANSPORT_ERROR:
    case broker::v1::CLOSE_REASON_PROTOCOL_ERROR:
      return BrokerError::kUnreachable;
    default:
      return BrokerError::kInternal;
  }
}

const char *CloseReasonName(broker::v1::CloseReason reason) {
  switch (reason) {
    case broker::v1::CLOSE_REASON_RELEASED:          return "released";
    case broker::v1::CLOSE_REASON_LEASE_EXPIRED:     return "lease expired";
    case broker::v1::CLOSE_REASON_REVOKED:           return "revoked";
    case broker::v1::CLOSE_REASON_DEVICE_REMOVED:    return "device removed";
    case broker::v1::CLOSE_REASON_HEARTBEAT_TIMEOUT: return "heartbeat timeout";
    case broker::v1::CLOSE_REASON_TRANSPORT_ERROR:   return "transport error";
    case broker::v1::CLOSE_REASON_PROTOCOL_ERROR:    return "protocol error";
    case broker::v1::CLOSE_REASON_REJECTED:          return "rejected";
    case broker::v1::CLOSE_REASON_SHUTDOWN:          return "shutdown";
    default:                                         return "unspecified";
  }
}

Session::Session(std::string session_id, std::shared_ptr<FrameChannel> channel,
                 SessionRole role, const SessionOptions &options)
    : id_(std::move(session_id)),
      channel_(std::move(channel)),
      role_(role),
      options_(options) {
  if (options_.heartbeat_interval.count() <= 0) {
    options_.heartbeat_interval = std::chrono::milliseconds(1000);
  }
  if (options_.missed_heartbeat_limit == 0) options_.missed_heartbeat_limit = 1;
}

Session::~Session() {
  Close(broker::v1::CLOSE_REASON_SHUTDOWN, "session destroyed");
  Join();
}

void Session::Start() {
  if (started_.exchange(true)) return;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_heartbeat_rx_ = std::chrono::steady_clock::now();
  }
  // 线程退出时才放开引用, 最后一个引用在此释放时析构发生在循环之外
  auto self = shared_from_this();
  reader_ = std::thread([self] { self->ReaderLoop(); });
  heartbeat_ = std::thread([self] { self->HeartbeatLoop(); });
  LogDebug("Session[%s]: started (%s, heartbeat %lldms x %u)", id_.c_str(),
           role_ == SessionRole::kImport ? "import" : "export",
           static_cast<long long>(options_.heartbeat_interval.count()),
           options_.missed_heartbeat_limit);
}

void Session::Join() {
  std::lock_guard<std::mutex> lock(join_mutex_);
  for (std::thread *t : {&reader_, &heartbeat_}) {
    if (!t->joinable()) continue;
    if (t->get_id() == std::this_thread::get_id()) {
      // 本线程仍持有 self, 返回后才会释放
      t->detach();
    } else {
      t->join();
    }
  }
}

bool Session::SendFrame(const broker::v1::Frame &frame) {
  return channel_->Send(frame);
}

// ──────────────── import 端 ────────────────

std::future<TransferResult> Session::Submit(broker::v1::TransferFrame frame,
                                           uint64_t *sequence) {
  std::promise<TransferResult> promise;
  auto future = promise.get_future();

  if (closed_.load()) {
    TransferResult result;
    result.status = broker::v1::TRANSFER_STATUS_CANCELLED;
    result.error = CloseReasonToError(close_reason());
    promise.set_value(std::move(result));
    return future;
  }

  bool sent = false;
  {
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    const StreamKey stream{frame.endpoint(), static_cast<int>(frame.direction())};
    const uint64_t seq = ++tx_sequence_[stream];
    frame.set_sequence(seq);
    if (sequence) *sequence = seq;
    frame.set_status(broker::v1::TRANSFER_STATUS_PENDING);
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (closed_.load()) {
        TransferResult result;
        result.status = broker::v1::TRANSFER_STATUS_CANCELLED;
        result.error = CloseReasonToError(close_reason_);
        promise.set_value(std::move(result));
        return future;
      }
      pending_.emplace(PendingKey{frame.endpoint(),
                                  static_cast<int>(frame.direction()), seq},
                       std::move(promise));
    }
    broker::v1::Frame out;
    *out.mutable_submit() = std::move(frame);
    sent = SendFrame(out);
  }
  if (!sent) {
    Shutdown(broker::v1::CLOSE_REASON_TRANSPORT_ERROR, "send failed", false,
             false);
  }
  return future;
}

void Session::Abandon(uint32_t endpoint, broker::v1::Direction direction,
                      uint64_t sequence) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  pending_.erase(PendingKey{endpoint, static_cast<int>(direction), sequence});
}

// ──────────────── export 端 ────────────────

bool Session::Complete(const broker::v1::TransferFrame &completion) {
  if (closed_.load()) return false;
  broker::v1::Frame out;
  *out.mutable_complete() = completion;
  bool sent;
  {
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    sent = SendFrame(out);
  }
  if (!sent) {
    Shutdown(broker::v1::CLOSE_REASON_TRANSPORT_ERROR, "send failed", false,
             false);
  }
  return sent;
}

// ──────────────── 收发循环 ────────────────

void Session::ReaderLoop() {
  broker::v1::Frame frame;
  while (!closed_.load()) {
    const RecvStatus st =
        channel_->Receive(&frame, std::chrono::milliseconds(100));
    if (st == RecvStatus::kTimeout) continue;
    if (st == RecvStatus::kClosed) {
      Shutdown(broker::v1::CLOSE_REASON_TRANSPORT_ERROR, "channel closed",
               false, true);
      break;
    }
    HandleFrame(frame);
  }
}

void Session::HandleFrame(const broker::v1::Frame &frame) {
  switch (frame.body_case()) {
    case broker::v1::Frame::kHeartbeat: {
      std::lock_guard<std::mutex> lock(state_mutex_);
      last_heartbeat_rx_ = std::chrono::steady_clock::now();
      heartbeats_rx_.fetch_add(1);
      return;
    }

    case broker::v1::Frame::kClose:
      LogInfo("Session[%s]: peer closed (%s%s%s)", id_.c_str(),
              CloseReasonName(frame.close().reason()),
              frame.close().detail().empty() ? "" : ": ",
              frame.close().detail().c_str());
      Shutdown(frame.close().reason(), frame.close().detail(), false, true);
      return;

    case broker::v1::Frame::kSubmit: {
      const auto &submit = frame.submit();
      if (role_ != SessionRole::kExport) break;
      bool in_order;
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        uint64_t &last =
            rx_sequence_[StreamKey{submit.endpoint(),
                                   static_cast<int>(submit.direction())}];
        in_order = submit.sequence() > last;
        if (in_order) last = submit.sequence();
      }
      if (!in_order) {
        LogWarn("Session[%s]: ep 0x%02x sequence %llu out of order",
                id_.c_str(), submit.endpoint(),
                static_cast<unsigned long long>(submit.sequence()));
        Close(broker::v1::CLOSE_REASON_PROTOCOL_ERROR, "sequence regression");
        return;
      }
      if (submit_handler_) submit_handler_(submit);
      return;
    }

    case broker::v1::Frame::kComplete: {
      const auto &done = frame.complete();
      if (role_ != SessionRole::kImport) break;
      std::promise<TransferResult> promise;
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = pending_.find(PendingKey{
            done.endpoint(), static_cast<int>(done.direction()),
            done.sequence()});
        if (it == pending_.end()) {
          LogDebug("Session[%s]: late completion ep 0x%02x seq %llu dropped",
                   id_.c_str(), done.endpoint(),
                   static_cast<unsigned long long>(done.sequence()));
          return;
        }
        promise = std::move(it->second);
        pending_.erase(it);
      }
      TransferResult result;
      result.status = done.status();
      result.data = done.payload();
      result.actual_length = done.actual_length();
      if (done.status() == broker::v1::TRANSFER_STATUS_DEVICE_GONE) {
        result.error = BrokerError::kDeviceRemoved;
      }
      promise.set_value(std::move(result));
      return;
    }

    default:
      break;
  }

  LogWarn("Session[%s]: unexpected frame type %d", id_.c_str(),
          static_cast<int>(frame.body_case()));
  Close(broker::v1::CLOSE_REASON_PROTOCOL_ERROR, "unexpected frame");
}

void Session::HeartbeatLoop() {
  const auto interval = options_.heartbeat_interval;
  const auto limit = interval * options_.missed_heartbeat_limit;

  std::unique_lock<std::mutex> lock(state_mutex_);
  while (!closed_.load()) {
    state_cv_.wait_for(lock, interval, [this] { return closed_.load(); });
    if (closed_.load()) break;

    const auto silent = std::chrono::steady_clock::now() - last_heartbeat_rx_;
    lock.unlock();

    if (silent > limit) {
      LogWarn("Session[%s]: no heartbeat for %lld ms, tearing down",
              id_.c_str(),
              static_cast<long long>(
                  std::chrono::duration_cast<std::chrono::milliseconds>(silent)
                      .count()));
      Close(broker::v1::CLOSE_REASON_HEARTBEAT_TIMEOUT, "missed heartbeats");
      lock.lock();
      break;
    }

    broker::v1::Frame hb;
    hb.mutable_heartbeat()->set_counter(++heartbeat_counter_);
    ToProtoTimestamp(std::chrono::system_clock::now(),
                     hb.mutable_heartbeat()->mutable_sent_at());
    bool sent;
    {
      std::lock_guard<std::mutex> send_lock(send_mutex_);
      sent = SendFrame(hb);
    }
    if (!sent) {
      Shutdown(broker::v1::CLOSE_REASON_TRANSPORT_ERROR, "send failed", false,
               false);
    }
    lock.lock();
  }
}

// ──────────────── 关闭 ────────────────

void Session::Close(broker::v1::CloseReason reason, const std::string &detail) {
  Shutdown(reason, detail, true, false);
}

void Session::Shutdown(broker::v1::CloseReason reason,
                       const std::string &detail, bool notify_peer,
                       bool remote) {
  std::map<PendingKey, std::promise<TransferResult>> orphaned;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (closed_.load()) return;
    closed_.store(true);
    close_reason_ = reason;
    close_detail_ = detail;
    orphaned.swap(pending_);
  }
  state_cv_.notify_all();

  if (notify_peer) {
    broker::v1::Frame close;
    close.mutable_close()->set_reason(reason);
    close.mutable_close()->set_detail(detail);
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    if (!SendFrame(close)) {
      LogDebug("Session[%s]: close frame not delivered", id_.c_str());
    }
  }
  channel_->Close();

  const BrokerError err = CloseReasonToError(reason);
  for (auto &kv : orphaned) {
    TransferResult result;
    result.status = broker::v1::TRANSFER_STATUS_CANCELLED;
    result.error = err;
    kv.second.set_value(std::move(result));
  }

  LogInfo("Session[%s]: closed (%s%s%s), %zu in-flight cancelled", id_.c_str(),
          CloseReasonName(reason), detail.empty() ? "" : ": ", detail.c_str(),
          orphaned.size());

  if (close_handler_) close_handler_(reason, detail, remote);
}

bool Session::Wait(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return state_cv_.wait_for(lock, timeout, [this] { return closed_.load(); });
}

broker::v1::CloseReason Session::close_reason() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return close_reason_;
}

std::string Session::close_detail() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return close_detail_;
}

size_t Session::pending() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return pending_.size();
}

}  // namespace transport
}  // namespace usb_broker
