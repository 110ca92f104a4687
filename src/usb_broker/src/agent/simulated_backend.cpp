#include "usb_broker/agent/simulated_backend.hpp"
#include "usb_broker/common/log.hpp"

#include <chrono>
#include <cstdlib>
#include <random>
#include <thread>

namespace usb_broker {
namespace agent {

namespace {

constexpr uint8_t kReqGetStatus = 0x00;
constexpr uint8_t kReqGetDescriptor = 0x06;
constexpr uint8_t kDescDevice = 0x01;
constexpr uint8_t kDirIn = 0x80;

uint16_t BcdUsbFor(broker::v1::UsbSpeed speed) {
  switch (speed) {
    case broker::v1::USB_SPEED_SUPER:
    case broker::v1::USB_SPEED_SUPER_PLUS:
      return 0x0300;
    case broker::v1::USB_SPEED_HIGH:
      return 0x0200;
    default:
      return 0x0110;
  }
}

std::string DeviceDescriptorBytes(const broker::v1::DeviceDescriptor &d) {
  const uint16_t bcd_usb = BcdUsbFor(d.speed());
  std::string out(18, '\0');
  out[0] = 18;
  out[1] = static_cast<char>(kDescDevice);
  out[2] = static_cast<char>(bcd_usb & 0xff);
  out[3] = static_cast<char>(bcd_usb >> 8);
  out[4] = static_cast<char>(d.device_class());
  out[5] = static_cast<char>(d.device_subclass());
  out[6] = static_cast<char>(d.device_protocol());
  out[7] = 64;  // bMaxPacketSize0
  out[8] = static_cast<char>(d.vendor_id() & 0xff);
  out[9] = static_cast<char>(d.vendor_id() >> 8);
  out[10] = static_cast<char>(d.product_id() & 0xff);
  out[11] = static_cast<char>(d.product_id() >> 8);
  out[12] = static_cast<char>(d.bcd_device() & 0xff);
  out[13] = static_cast<char>(d.bcd_device() >> 8);
  out[14] = 1;  // iManufacturer
  out[15] = 2;  // iProduct
  out[16] = d.serial().empty() ? 0 : 3;
  out[17] = static_cast<char>(d.num_configurations());
  return out;
}

void RandomSleep(uint32_t max_ms) {
  if (max_ms == 0) return;
  thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> dist(0, max_ms);
  std::this_thread::sleep_for(std::chrono::milliseconds(dist(rng)));
}

}  // namespace

SimulatedDeviceBackend::SimulatedDeviceBackend(
    const std::vector<SimulatedDeviceSpec> &devices) {
  for (const auto &spec : devices) {
    SimDevice dev;
    dev.descriptor = DescriptorFromSpec(spec, next_devnum_++);
    devices_[spec.bus_path] = std::move(dev);
  }
}

SimulatedDeviceBackend::~SimulatedDeviceBackend() { StopHotplug(); }

broker::v1::DeviceDescriptor
SimulatedDeviceBackend::DescriptorFromSpec(const SimulatedDeviceSpec &spec,
                                           uint32_t devnum) {
  broker::v1::DeviceDescriptor d;
  d.set_bus_path(spec.bus_path);
  d.set_busnum(static_cast<uint32_t>(std::strtoul(spec.bus_path.c_str(), nullptr, 10)));
  d.set_devnum(devnum);
  d.set_vendor_id(spec.vendor_id);
  d.set_product_id(spec.product_id);
  d.set_bcd_device(0x0100);
  d.set_device_class(spec.device_class);
  d.set_speed(ParseUsbSpeed(spec.speed));
  d.set_serial(spec.serial);
  d.set_manufacturer(spec.manufacturer);
  d.set_product(spec.product);
  d.set_num_configurations(1);
  d.set_num_interfaces(1);
  return d;
}

std::vector<broker::v1::DeviceDescriptor> SimulatedDeviceBackend::Enumerate() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<broker::v1::DeviceDescriptor> result;
  for (const auto &kv : devices_) {
    if (kv.second.present) result.push_back(kv.second.descriptor);
  }
  return result;
}

BrokerError SimulatedDeviceBackend::Claim(const std::string &bus_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(bus_path);
  if (it == devices_.end() || !it->second.present) return BrokerError::kNotFound;
  if (it->second.claimed) return BrokerError::kBusy;
  it->second.claimed = true;
  LogDebug("SimBackend: claimed %s", bus_path.c_str());
  return BrokerError::kOk;
}

BrokerError SimulatedDeviceBackend::Release(const std::string &bus_path) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(bus_path);
    if (it == devices_.end()) return BrokerError::kNotFound;
    it->second.claimed = false;
    it->second.loopback.clear();
  }
  data_cv_.notify_all();
  LogDebug("SimBackend: released %s", bus_path.c_str());
  return BrokerError::kOk;
}

bool SimulatedDeviceBackend::IsClaimed(const std::string &bus_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(bus_path);
  return it != devices_.end() && it->second.claimed;
}

std::vector<broker::v1::TransferFrame>
SimulatedDeviceBackend::TransferLog(const std::string &bus_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(bus_path);
  if (it == devices_.end()) return {};
  return it->second.log;
}

broker::v1::TransferFrame
SimulatedDeviceBackend::ControlLocked(SimDevice &dev,
                                      const broker::v1::TransferFrame &submit) {
  ControlSetup setup;
  if (!ParseControlSetup(submit.setup(), &setup)) {
    return MakeCompletion(submit, broker::v1::TRANSFER_STATUS_ERROR);
  }

  const bool in = (setup.request_type & kDirIn) != 0;
  std::string data;
  if (in && setup.request == kReqGetDescriptor && (setup.value >> 8) == kDescDevice) {
    data = DeviceDescriptorBytes(dev.descriptor);
  } else if (in && setup.request == kReqGetStatus) {
    data.assign(2, '\0');
  } else if (in) {
    return MakeCompletion(submit, broker::v1::TRANSFER_STATUS_STALL);
  } else {
    auto done = MakeCompletion(submit, broker::v1::TRANSFER_STATUS_OK);
    done.set_actual_length(static_cast<uint32_t>(submit.payload().size()));
    return done;
  }

  if (data.size() > setup.length) data.resize(setup.length);
  auto done = MakeCompletion(submit, broker::v1::TRANSFER_STATUS_OK);
  done.set_actual_length(static_cast<uint32_t>(data.size()));
  done.set_payload(std::move(data));
  return done;
}

broker::v1::TransferFrame
SimulatedDeviceBackend::Transfer(const std::string &bus_path,
                                 const broker::v1::TransferFrame &submit) {
  RandomSleep(jitter_ms_.load());

  std::unique_lock<std::mutex> lock(mutex_);
  auto it = devices_.find(bus_path);
  if (it == devices_.end() || !it->second.present) {
    return MakeCompletion(submit, broker::v1::TRANSFER_STATUS_DEVICE_GONE);
  }
  SimDevice &dev = it->second;
  if (!dev.claimed) {
    return MakeCompletion(submit, broker::v1::TRANSFER_STATUS_ERROR);
  }
  dev.log.push_back(submit);

  switch (submit.type()) {
    case broker::v1::TRANSFER_TYPE_CONTROL:
      return ControlLocked(dev, submit);
    case broker::v1::TRANSFER_TYPE_BULK:
    case broker::v1::TRANSFER_TYPE_INTERRUPT:
      break;
    default:
      return MakeCompletion(submit, broker::v1::TRANSFER_STATUS_ERROR);
  }

  const uint32_t ep_num = submit.endpoint() & 0x0f;
  if (submit.direction() == broker::v1::DIRECTION_OUT) {
    dev.loopback[ep_num].push_back(submit.payload());
    lock.unlock();
    data_cv_.notify_all();
    auto done = MakeCompletion(submit, broker::v1::TRANSFER_STATUS_OK);
    done.set_actual_length(static_cast<uint32_t>(submit.payload().size()));
    return done;
  }

  // IN: 等待同号 OUT 端点写入的数据
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(submit.timeout_ms());
  for (;;) {
    auto dit = devices_.find(bus_path);
    if (dit == devices_.end() || !dit->second.present) {
      return MakeCompletion(submit, broker::v1::TRANSFER_STATUS_DEVICE_GONE);
    }
    if (!dit->second.claimed) {
      return MakeCompletion(submit, broker::v1::TRANSFER_STATUS_CANCELLED);
    }
    auto &queue = dit->second.loopback[ep_num];
    if (!queue.empty()) {
      std::string data = std::move(queue.front());
      queue.pop_front();
      auto done = MakeCompletion(submit, broker::v1::TRANSFER_STATUS_OK);
      if (data.size() > submit.length()) {
        data.resize(submit.length());
        done.set_status(broker::v1::TRANSFER_STATUS_OVERFLOW);
      }
      done.set_actual_length(static_cast<uint32_t>(data.size()));
      done.set_payload(std::move(data));
      return done;
    }
    if (data_cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
      auto rit = devices_.find(bus_path);
      if (rit != devices_.end() && rit->second.present &&
          !rit->second.loopback[ep_num].empty()) {
        continue;
      }
      return MakeCompletion(submit, broker::v1::TRANSFER_STATUS_TIMEOUT);
    }
  }
}

bool SimulatedDeviceBackend::StartHotplug(HotplugCallback callback) {
  std::lock_guard<std::mutex> lock(hotplug_mutex_);
  hotplug_ = std::move(callback);
  return true;
}

void SimulatedDeviceBackend::StopHotplug() {
  std::lock_guard<std::mutex> lock(hotplug_mutex_);
  hotplug_ = nullptr;
}

void SimulatedDeviceBackend::Plug(const SimulatedDeviceSpec &spec) {
  HotplugEvent ev;
  ev.kind = HotplugEvent::Kind::kAttached;
  ev.bus_path = spec.bus_path;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    SimDevice dev;
    dev.descriptor = DescriptorFromSpec(spec, next_devnum_++);
    ev.descriptor = dev.descriptor;
    devices_[spec.bus_path] = std::move(dev);
  }
  LogInfo("SimBackend: plugged %s", spec.bus_path.c_str());

  HotplugCallback cb;
  {
    std::lock_guard<std::mutex> lock(hotplug_mutex_);
    cb = hotplug_;
  }
  if (cb) cb(ev);
}

void SimulatedDeviceBackend::Unplug(const std::string &bus_path) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(bus_path);
    if (it == devices_.end()) return;
    it->second.present = false;
    it->second.claimed = false;
    it->second.loopback.clear();
  }
  data_cv_.notify_all();
  LogInfo("SimBackend: unplugged %s", bus_path.c_str());

  HotplugEvent ev;
  ev.kind = HotplugEvent::Kind::kDetached;
  ev.bus_path = bus_path;
  HotplugCallback cb;
  {
    std::lock_guard<std::mutex> lock(hotplug_mutex_);
    cb = hotplug_;
  }
  if (cb) cb(ev);
}

}  // namespace agent
}  // namespace usb_broker
