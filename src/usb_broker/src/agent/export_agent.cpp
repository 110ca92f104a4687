#include "usb_broker/agent/export_agent.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <memory>
#include <tuple>

namespace usb_broker {
namespace agent {

namespace {

/// 单线程串行执行器: 一个 (endpoint, direction) 一个
class TransferStrand {
public:
  TransferStrand() : thread_([this] { Run(); }) {}
  ~TransferStrand() { Stop(); }

  void Post(std::function<void()> task) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopped_) return;
      tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
  }

  /// 丢弃排队任务, 等待当前任务结束
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
      tasks_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
  }

private:
  void Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
      cv_.wait(lock, [this] { return stopped_ || !tasks_.empty(); });
      if (stopped_) return;
      auto task = std::move(tasks_.front());
      tasks_.pop_front();
      lock.unlock();
      task();
      lock.lock();
    }
  }

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> tasks_;
  bool stopped_{false};
  std::thread thread_;
};

class StrandSet {
public:
  void Post(uint32_t endpoint, broker::v1::Direction direction,
            std::function<void()> task) {
    TransferStrand *strand;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopped_) return;
      auto &slot = strands_[std::make_tuple(endpoint, static_cast<int>(direction))];
      if (!slot) slot = std::make_unique<TransferStrand>();
      strand = slot.get();
    }
    strand->Post(std::move(task));
  }

  void StopAll() {
    std::map<std::tuple<uint32_t, int>, std::unique_ptr<TransferStrand>> strands;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
      strands.swap(strands_);
    }
    strands.clear();  // 析构即 join
  }

private:
  std::mutex mutex_;
  bool stopped_{false};
  std::map<std::tuple<uint32_t, int>, std::unique_ptr<TransferStrand>> strands_;
};

}  // namespace

ExportAgent::ExportAgent(const ExportAgentConfig &config,
                         std::shared_ptr<DeviceBackend> backend,
                         std::shared_ptr<BrokerLink> link)
    : config_(config), backend_(std::move(backend)), link_(std::move(link)) {}

ExportAgent::~ExportAgent() { Stop(); }

// ──────────────── 生命周期 ────────────────

void ExportAgent::Start() {
  stop_.store(false);

  // 先挂热插拔, 再枚举, 两者之间插入的设备不会丢
  if (!backend_->StartHotplug([this](const HotplugEvent &ev) { HandleHotplug(ev); })) {
    LogError("ExportAgent: hotplug notifications unavailable on %s backend",
             backend_->Name().c_str());
  }

  size_t exported = 0;
  for (const auto &desc : backend_->Enumerate()) {
    if (!MatchesFilters(desc, config_.device_filters)) {
      LogDebug("ExportAgent: skipping %s (%04x:%04x) by filter",
               desc.bus_path().c_str(), desc.vendor_id(), desc.product_id());
      continue;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[desc.bus_path()].descriptor = desc;
    ++exported;
  }
  LogInfo("ExportAgent: %zu device(s) eligible for export on %s backend",
          exported, backend_->Name().c_str());

  control_thread_ = std::thread([this] { ControlLoop(); });
  heartbeat_thread_ = std::thread([this] { HeartbeatLoop(); });
}

void ExportAgent::Stop() {
  if (stop_.exchange(true)) return;
  cv_.notify_all();
  link_->CancelWatch();
  backend_->StopHotplug();
  CloseAllSessions(broker::v1::CLOSE_REASON_SHUTDOWN, "export agent stopping");

  if (control_thread_.joinable()) control_thread_.join();
  if (heartbeat_thread_.joinable()) heartbeat_thread_.join();

  std::vector<std::string> to_release;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, std::chrono::seconds(5), [this] { return serving_ == 0; })) {
      LogWarn("ExportAgent: %zu session(s) still draining at shutdown", serving_);
    }
    for (auto &kv : devices_) {
      if (kv.second.claimed && !kv.second.session) {
        kv.second.claimed = false;
        to_release.push_back(kv.first);
      }
    }
  }
  for (const auto &bus : to_release) {
    if (backend_->Release(bus) != BrokerError::kOk) {
      LogWarn("ExportAgent: release of %s at shutdown failed", bus.c_str());
    }
  }
  registered_.store(false);
  LogInfo("ExportAgent: stopped");
}

void ExportAgent::SleepFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, duration, [this] { return stop_.load(); });
}

std::string ExportAgent::CurrentToken() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return host_token_;
}

bool ExportAgent::WaitRegistered(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return registered_.load(); });
}

// ──────────────── 注册 / 命令流 / 心跳 ────────────────

bool ExportAgent::RegisterAndReport() {
  const int64_t ts = UnixSeconds();
  const std::string signature =
      config_.credential.empty()
          ? std::string()
          : ComputeHmacSha256Hex(config_.credential,
                                 HostSignaturePayload(config_.host_id,
                                                      config_.advertise_address, ts));

  std::string token;
  const BrokerError err = link_->RegisterHost(
      config_.host_id, config_.advertise_address, ts, signature, &token);
  if (err != BrokerError::kOk) {
    LogWarn("ExportAgent: register host %s failed: %s", config_.host_id.c_str(),
            ToString(err));
    return false;
  }

  // broker 侧旧租约已随重新注册结束
  CloseAllSessions(broker::v1::CLOSE_REASON_REVOKED, "host re-registered");

  std::vector<std::string> buses;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    host_token_ = token;
    for (auto &kv : devices_) {
      kv.second.authorized_token.clear();
      buses.push_back(kv.first);
    }
  }
  for (const auto &bus : buses) ReportOne(bus);

  registered_.store(true);
  cv_.notify_all();
  LogInfo("ExportAgent: registered as %s (%s), %zu device(s) reported",
          config_.host_id.c_str(), config_.advertise_address.c_str(),
          buses.size());
  return true;
}

void ExportAgent::ReportOne(const std::string &bus_path) {
  broker::v1::DeviceDescriptor desc;
  std::string token;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(bus_path);
    if (it == devices_.end()) return;
    desc = it->second.descriptor;
    token = host_token_;
  }

  std::string device_id;
  const BrokerError err =
      link_->ReportDevice(config_.host_id, token, desc, &device_id);
  if (err != BrokerError::kOk) {
    LogWarn("ExportAgent: report %s failed: %s", bus_path.c_str(), ToString(err));
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(bus_path);
  if (it != devices_.end()) it->second.device_id = device_id;
  LogInfo("ExportAgent: exported %s as %s", bus_path.c_str(), device_id.c_str());
}

void ExportAgent::ControlLoop() {
  auto backoff = std::chrono::milliseconds(500);
  const auto max_backoff = std::chrono::milliseconds(8000);

  while (!stop_.load()) {
    if (!registered_.load()) {
      if (!RegisterAndReport()) {
        SleepFor(backoff);
        backoff = std::min(backoff * 2, max_backoff);
        continue;
      }
      backoff = std::chrono::milliseconds(500);
    }

    const BrokerError err = link_->WatchCommands(
        config_.host_id, CurrentToken(),
        [this](const broker::v1::HostCommand &cmd) { HandleCommand(cmd); });
    if (stop_.load()) break;

    if (err == BrokerError::kUnauthenticated || err == BrokerError::kNotFound) {
      LogWarn("ExportAgent: broker rejected command stream (%s), re-registering",
              ToString(err));
      registered_.store(false);
    } else if (err != BrokerError::kCancelled) {
      LogWarn("ExportAgent: command stream lost: %s", ToString(err));
      SleepFor(backoff);
      backoff = std::min(backoff * 2, max_backoff);
    }
  }
}

void ExportAgent::HeartbeatLoop() {
  const auto interval = std::chrono::milliseconds(config_.host_heartbeat_interval_ms);
  while (!stop_.load()) {
    SleepFor(interval);
    if (stop_.load() || !registered_.load()) continue;

    uint32_t attached = 0;
    uint32_t sessions = 0;
    std::string token;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      attached = static_cast<uint32_t>(devices_.size());
      for (const auto &kv : devices_) {
        if (kv.second.session) ++sessions;
      }
      token = host_token_;
    }

    const BrokerError err =
        link_->Heartbeat(config_.host_id, token, attached, sessions);
    if (err == BrokerError::kUnauthenticated || err == BrokerError::kNotFound) {
      LogWarn("ExportAgent: broker no longer knows this host (%s), re-registering",
              ToString(err));
      registered_.store(false);
      link_->CancelWatch();
    } else if (err != BrokerError::kOk) {
      LogWarn("ExportAgent: heartbeat failed: %s", ToString(err));
    }
  }
}

void ExportAgent::HandleCommand(const broker::v1::HostCommand &command) {
  const std::string &bus = command.bus_path();
  const std::string &token = command.lease_token();

  if (command.type() == broker::v1::HOST_COMMAND_TYPE_START_SESSION) {
    std::shared_ptr<transport::Session> stale;
    bool need_claim = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = devices_.find(bus);
      if (it == devices_.end()) {
        LogWarn("ExportAgent: START for unknown device %s", bus.c_str());
        return;
      }
      ExportedDevice &dev = it->second;
      if (dev.authorized_token == token) return;  // 补发的重复命令
      if (dev.session && dev.session_token != token) stale = dev.session;
      dev.authorized_token = token;
      dev.consumer_id = command.consumer_id();
      need_claim = !dev.claimed;
    }
    if (stale) stale->Close(broker::v1::CLOSE_REASON_REVOKED, "superseded by new lease");

    if (need_claim) {
      const BrokerError err = backend_->Claim(bus);
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = devices_.find(bus);
      if (err != BrokerError::kOk) {
        LogError("ExportAgent: claim %s for %s failed: %s", bus.c_str(),
                 command.consumer_id().c_str(), ToString(err));
        if (it != devices_.end() && it->second.authorized_token == token) {
          it->second.authorized_token.clear();
        }
        return;
      }
      if (it != devices_.end()) it->second.claimed = true;
    }
    LogInfo("ExportAgent: %s authorized for %s", bus.c_str(),
            command.consumer_id().c_str());
    cv_.notify_all();
    return;
  }

  if (command.type() == broker::v1::HOST_COMMAND_TYPE_STOP_SESSION) {
    std::shared_ptr<transport::Session> session;
    bool release = false;
    bool never_opened = false;
    std::string device_id;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = devices_.find(bus);
      if (it == devices_.end()) return;
      ExportedDevice &dev = it->second;
      device_id = dev.device_id;
      if (dev.session && dev.session_token == token) {
        session = dev.session;
      } else if (dev.authorized_token == token) {
        // 会话从未建立
        never_opened = true;
        dev.authorized_token.clear();
        release = dev.claimed && !dev.session;
        if (release) dev.claimed = false;
      }
    }
    if (session) {
      LogInfo("ExportAgent: stopping session on %s (%s)", bus.c_str(),
              transport::CloseReasonName(command.reason()));
      session->Close(command.reason(), command.detail());
    } else if (release) {
      const BrokerError err = backend_->Release(bus);
      if (err != BrokerError::kOk) {
        LogWarn("ExportAgent: release %s failed: %s", bus.c_str(), ToString(err));
      }
    }
    // 没有会话线程来确认解绑, 这里直接上报
    if (never_opened && !device_id.empty()) {
      const BrokerError err = link_->ReportSessionState(
          config_.host_id, CurrentToken(), device_id, token, false,
          command.reason());
      if (err != BrokerError::kOk) {
        LogWarn("ExportAgent: unbind report for %s failed: %s",
                device_id.c_str(), ToString(err));
      }
    }
  }
}

// ──────────────── 热插拔 ────────────────

void ExportAgent::HandleHotplug(const HotplugEvent &event) {
  if (event.kind == HotplugEvent::Kind::kDetached) {
    HandleDeviceRemoved(event.bus_path, "device detached");
    return;
  }
  if (!MatchesFilters(event.descriptor, config_.device_filters)) {
    LogDebug("ExportAgent: ignoring %s by filter", event.bus_path.c_str());
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[event.bus_path].descriptor = event.descriptor;
  }
  LogInfo("ExportAgent: %s attached (%04x:%04x)", event.bus_path.c_str(),
          event.descriptor.vendor_id(), event.descriptor.product_id());
  if (registered_.load()) ReportOne(event.bus_path);
}

void ExportAgent::HandleDeviceRemoved(const std::string &bus_path,
                                      const std::string &reason) {
  std::shared_ptr<transport::Session> session;
  std::string device_id;
  std::string token;
  bool release = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(bus_path);
    if (it == devices_.end()) return;
    session = it->second.session;
    device_id = it->second.device_id;
    release = it->second.claimed && !session;
    token = host_token_;
    devices_.erase(it);
  }
  cv_.notify_all();
  LogWarn("ExportAgent: %s removed (%s)", bus_path.c_str(), reason.c_str());

  // 先拆会话: Import Agent 立即看到 DEVICE_REMOVED
  if (session) session->Close(broker::v1::CLOSE_REASON_DEVICE_REMOVED, reason);
  if (release) {
    const BrokerError err = backend_->Release(bus_path);
    if (err != BrokerError::kOk && err != BrokerError::kNotFound) {
      LogWarn("ExportAgent: release of removed %s failed: %s", bus_path.c_str(),
              ToString(err));
    }
  }

  if (device_id.empty() || !registered_.load()) return;
  const BrokerError err =
      link_->RemoveDevice(config_.host_id, token, device_id, reason);
  if (err != BrokerError::kOk) {
    LogWarn("ExportAgent: deregister %s failed: %s", device_id.c_str(),
            ToString(err));
  }
}

void ExportAgent::CloseAllSessions(broker::v1::CloseReason reason,
                                   const std::string &detail) {
  std::vector<std::shared_ptr<transport::Session>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &kv : devices_) {
      if (kv.second.session) sessions.push_back(kv.second.session);
    }
  }
  for (auto &s : sessions) s->Close(reason, detail);
}

// ──────────────── 会话 ────────────────

void ExportAgent::Reject(transport::FrameChannel &channel,
                         broker::v1::CloseReason reason,
                         const std::string &detail) {
  LogWarn("ExportAgent: rejecting session from %s: %s", channel.Peer().c_str(),
          detail.c_str());
  broker::v1::Frame close;
  close.mutable_close()->set_reason(reason);
  close.mutable_close()->set_detail(detail);
  if (!channel.Send(close)) {
    LogDebug("ExportAgent: reject notice to %s not delivered",
             channel.Peer().c_str());
  }
  channel.Close();
}

void ExportAgent::ServeSession(std::shared_ptr<transport::FrameChannel> channel) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++serving_;
  }
  struct ServingGuard {
    ExportAgent *agent;
    ~ServingGuard() {
      {
        std::lock_guard<std::mutex> lock(agent->mutex_);
        --agent->serving_;
      }
      agent->cv_.notify_all();
    }
  } guard{this};

  broker::v1::Frame frame;
  const auto hello_wait = std::chrono::milliseconds(
      config_.session_authorize_wait_ms + config_.rpc_timeout_ms);
  if (channel->Receive(&frame, hello_wait) != transport::RecvStatus::kFrame ||
      !frame.has_hello()) {
    Reject(*channel, broker::v1::CLOSE_REASON_PROTOCOL_ERROR, "expected hello");
    return;
  }
  const broker::v1::SessionHello hello = frame.hello();

  auto find = [this, &hello]() {
    return std::find_if(devices_.begin(), devices_.end(),
                        [&hello](const std::pair<const std::string, ExportedDevice> &kv) {
                          return kv.second.device_id == hello.device_id();
                        });
  };

  std::shared_ptr<transport::Session> session;
  std::string bus;
  std::string device_id;
  broker::v1::DeviceDescriptor descriptor;
  transport::SessionOptions options;
  options.heartbeat_interval = std::chrono::milliseconds(config_.heartbeat_interval_ms);
  options.missed_heartbeat_limit = config_.missed_heartbeat_limit;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (find() == devices_.end()) {
      lock.unlock();
      Reject(*channel, broker::v1::CLOSE_REASON_DEVICE_REMOVED, "device not attached");
      return;
    }
    // START_SESSION 可能晚于 hello 到达
    const bool authorized = cv_.wait_for(
        lock, std::chrono::milliseconds(config_.session_authorize_wait_ms), [&] {
          if (stop_.load()) return true;
          auto it = find();
          return it != devices_.end() && it->second.claimed &&
                 it->second.authorized_token == hello.lease_token();
        });
    auto it = find();
    if (stop_.load() || it == devices_.end()) {
      lock.unlock();
      Reject(*channel, stop_.load() ? broker::v1::CLOSE_REASON_SHUTDOWN
                                    : broker::v1::CLOSE_REASON_DEVICE_REMOVED,
             "device unavailable");
      return;
    }
    if (!authorized) {
      lock.unlock();
      Reject(*channel, broker::v1::CLOSE_REASON_REJECTED, "lease not authorized");
      return;
    }
    if (it->second.session) {
      lock.unlock();
      Reject(*channel, broker::v1::CLOSE_REASON_REJECTED, "session already open");
      return;
    }

    bus = it->first;
    device_id = it->second.device_id;
    descriptor = it->second.descriptor;
    session = std::make_shared<transport::Session>(
        RandomHex(8), channel, transport::SessionRole::kExport, options);
    it->second.session = session;
    it->second.session_token = hello.lease_token();
  }

  auto strands = std::make_shared<StrandSet>();
  std::weak_ptr<transport::Session> weak = session;
  const uint32_t default_timeout = config_.default_transfer_timeout_ms;
  session->SetSubmitHandler([this, strands, weak, bus, default_timeout](
                                const broker::v1::TransferFrame &submit) {
    strands->Post(submit.endpoint(), submit.direction(),
                  [this, weak, bus, submit, default_timeout]() {
                    broker::v1::TransferFrame request = submit;
                    if (request.timeout_ms() == 0) request.set_timeout_ms(default_timeout);
                    const broker::v1::TransferFrame done = backend_->Transfer(bus, request);
                    auto s = weak.lock();
                    if (s) s->Complete(done);
                    if (done.status() == broker::v1::TRANSFER_STATUS_DEVICE_GONE) {
                      HandleDeviceRemoved(bus, "device gone during transfer");
                    }
                  });
  });

  broker::v1::Frame accept;
  accept.mutable_accept()->set_session_id(session->id());
  *accept.mutable_accept()->mutable_device_descriptor() = descriptor;
  accept.mutable_accept()->set_heartbeat_interval_ms(config_.heartbeat_interval_ms);
  accept.mutable_accept()->set_missed_heartbeat_limit(config_.missed_heartbeat_limit);

  if (channel->Send(accept)) {
    session->Start();
    LogInfo("ExportAgent: session %s opened on %s for %s", session->id().c_str(),
            bus.c_str(), hello.consumer_id().c_str());
    const BrokerError err = link_->ReportSessionState(
        config_.host_id, CurrentToken(), device_id, hello.lease_token(), true,
        broker::v1::CLOSE_REASON_UNSPECIFIED);
    if (err == BrokerError::kInvalidToken) {
      session->Close(broker::v1::CLOSE_REASON_REVOKED, "lease no longer valid");
    } else if (err != BrokerError::kOk) {
      LogWarn("ExportAgent: session-start report for %s failed: %s",
              device_id.c_str(), ToString(err));
    }
    while (!session->Wait(std::chrono::milliseconds(500))) {
      if (stop_.load()) {
        session->Close(broker::v1::CLOSE_REASON_SHUTDOWN, "export agent stopping");
      }
    }
  } else {
    session->Close(broker::v1::CLOSE_REASON_TRANSPORT_ERROR, "accept not delivered");
  }

  const broker::v1::CloseReason reason = session->close_reason();

  // 解除 claim, 新租约已接管时保留
  bool release = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(bus);
    if (it != devices_.end()) {
      ExportedDevice &dev = it->second;
      if (dev.session == session) {
        dev.session.reset();
        dev.session_token.clear();
      }
      const bool superseded = !dev.authorized_token.empty() &&
                              dev.authorized_token != hello.lease_token();
      release = !superseded && dev.claimed;
      if (!superseded) {
        dev.authorized_token.clear();
        dev.claimed = false;
      }
    }
  }
  cv_.notify_all();

  if (release) {
    const BrokerError err = backend_->Release(bus);
    if (err != BrokerError::kOk && err != BrokerError::kNotFound) {
      LogWarn("ExportAgent: unclaim %s failed: %s", bus.c_str(), ToString(err));
    }
  }
  strands->StopAll();
  session->Join();

  const BrokerError err = link_->ReportSessionState(
      config_.host_id, CurrentToken(), device_id, hello.lease_token(), false,
      reason);
  if (err != BrokerError::kOk) {
    LogWarn("ExportAgent: session-end report for %s failed: %s",
            device_id.c_str(), ToString(err));
  }
  LogInfo("ExportAgent: session %s on %s ended (%s)", session->id().c_str(),
          bus.c_str(), transport::CloseReasonName(reason));
}

// ──────────────── 查询 ────────────────

size_t ExportAgent::ActiveSessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t n = 0;
  for (const auto &kv : devices_) {
    if (kv.second.session) ++n;
  }
  return n;
}

std::vector<std::string> ExportAgent::ExportedDevices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> buses;
  for (const auto &kv : devices_) buses.push_back(kv.first);
  return buses;
}

std::string ExportAgent::DeviceIdFor(const std::string &bus_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(bus_path);
  return it == devices_.end() ? std::string() : it->second.device_id;
}

}  // namespace agent
}  // namespace usb_broker
