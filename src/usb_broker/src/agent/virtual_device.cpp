#include "usb_broker/agent/virtual_device.hpp"
#include "usb_broker/agent/device_backend.hpp"
#include "usb_broker/common/log.hpp"

namespace usb_broker {
namespace agent {

namespace {

// 远端超时后完成帧还需要一次网络往返
constexpr std::chrono::milliseconds kCompletionSlack(1000);

}  // namespace

VirtualUsbDevice::VirtualUsbDevice(std::string handle, std::string device_id,
                                   broker::v1::DeviceDescriptor descriptor,
                                   std::shared_ptr<transport::Session> session,
                                   std::chrono::milliseconds default_timeout)
    : handle_(std::move(handle)),
      device_id_(std::move(device_id)),
      descriptor_(std::move(descriptor)),
      session_(std::move(session)),
      default_timeout_(default_timeout) {}

void VirtualUsbDevice::SetFault(BrokerError fault) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fault_ == BrokerError::kOk) fault_ = fault;
}

BrokerError VirtualUsbDevice::fault() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fault_;
}

bool VirtualUsbDevice::IsOperational() const {
  return fault() == BrokerError::kOk && session_->IsOpen();
}

transport::TransferResult VirtualUsbDevice::FaultResult() const {
  transport::TransferResult result;
  result.status = broker::v1::TRANSFER_STATUS_CANCELLED;
  result.error = fault();
  if (result.error == BrokerError::kOk) {
    result.error = transport::CloseReasonToError(session_->close_reason());
  }
  return result;
}

std::future<transport::TransferResult>
VirtualUsbDevice::Submit(broker::v1::TransferFrame frame, uint64_t *sequence) {
  if (fault() != BrokerError::kOk) {
    std::promise<transport::TransferResult> failed;
    failed.set_value(FaultResult());
    return failed.get_future();
  }
  if (frame.timeout_ms() == 0) {
    frame.set_timeout_ms(static_cast<uint32_t>(default_timeout_.count()));
  }
  return session_->Submit(std::move(frame), sequence);
}

transport::TransferResult
VirtualUsbDevice::Transfer(broker::v1::TransferFrame frame) {
  if (frame.timeout_ms() == 0) {
    frame.set_timeout_ms(static_cast<uint32_t>(default_timeout_.count()));
  }
  const uint32_t endpoint = frame.endpoint();
  const broker::v1::Direction direction = frame.direction();
  const auto wait = std::chrono::milliseconds(frame.timeout_ms()) + kCompletionSlack;

  uint64_t sequence = 0;
  auto future = Submit(std::move(frame), &sequence);
  if (future.wait_for(wait) != std::future_status::ready) {
    session_->Abandon(endpoint, direction, sequence);
    LogWarn("VirtualUsbDevice[%s]: ep 0x%02x seq %llu got no completion",
            handle_.c_str(), endpoint,
            static_cast<unsigned long long>(sequence));
    transport::TransferResult result;
    result.status = broker::v1::TRANSFER_STATUS_TIMEOUT;
    result.error = BrokerError::kUnreachable;
    return result;
  }
  transport::TransferResult result = future.get();
  if (result.status == broker::v1::TRANSFER_STATUS_CANCELLED &&
      result.error != BrokerError::kOk && fault() != BrokerError::kOk) {
    result.error = fault();
  }
  return result;
}

transport::TransferResult VirtualUsbDevice::ControlTransfer(
    uint8_t request_type, uint8_t request, uint16_t value, uint16_t index,
    const std::string &data_out, uint16_t length, uint32_t timeout_ms) {
  const bool in = (request_type & 0x80) != 0;
  ControlSetup setup;
  setup.request_type = request_type;
  setup.request = request;
  setup.value = value;
  setup.index = index;
  setup.length = in ? length : static_cast<uint16_t>(data_out.size());

  broker::v1::TransferFrame frame;
  frame.set_type(broker::v1::TRANSFER_TYPE_CONTROL);
  frame.set_endpoint(0);
  frame.set_direction(in ? broker::v1::DIRECTION_IN : broker::v1::DIRECTION_OUT);
  frame.set_setup(EncodeControlSetup(setup));
  if (in) {
    frame.set_length(length);
  } else {
    frame.set_payload(data_out);
  }
  frame.set_timeout_ms(timeout_ms);
  return Transfer(std::move(frame));
}

namespace {

broker::v1::TransferFrame DataFrame(broker::v1::TransferType type,
                                    uint8_t endpoint,
                                    const std::string &data_out,
                                    uint32_t length, uint32_t timeout_ms) {
  const bool in = (endpoint & 0x80) != 0;
  broker::v1::TransferFrame frame;
  frame.set_type(type);
  frame.set_endpoint(endpoint);
  frame.set_direction(in ? broker::v1::DIRECTION_IN : broker::v1::DIRECTION_OUT);
  if (in) {
    frame.set_length(length);
  } else {
    frame.set_payload(data_out);
  }
  frame.set_timeout_ms(timeout_ms);
  return frame;
}

}  // namespace

transport::TransferResult
VirtualUsbDevice::BulkTransfer(uint8_t endpoint, const std::string &data_out,
                               uint32_t length, uint32_t timeout_ms) {
  return Transfer(DataFrame(broker::v1::TRANSFER_TYPE_BULK, endpoint, data_out,
                            length, timeout_ms));
}

transport::TransferResult
VirtualUsbDevice::InterruptTransfer(uint8_t endpoint,
                                    const std::string &data_out,
                                    uint32_t length, uint32_t timeout_ms) {
  return Transfer(DataFrame(broker::v1::TRANSFER_TYPE_INTERRUPT, endpoint,
                            data_out, length, timeout_ms));
}

// ──────────────── LocalDeviceTable ────────────────

BrokerError LocalDeviceTable::Publish(std::shared_ptr<VirtualUsbDevice> device) {
  if (!device) return BrokerError::kInvalidArgument;
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string handle = device->handle();
  if (!devices_.emplace(handle, std::move(device)).second) {
    return BrokerError::kBusy;
  }
  LogInfo("LocalDeviceTable: %s published", handle.c_str());
  return BrokerError::kOk;
}

void LocalDeviceTable::Withdraw(const std::string &handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (devices_.erase(handle) > 0) {
    LogInfo("LocalDeviceTable: %s withdrawn", handle.c_str());
  }
}

std::shared_ptr<VirtualUsbDevice>
LocalDeviceTable::Find(const std::string &handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(handle);
  return it == devices_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<VirtualUsbDevice>> LocalDeviceTable::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<VirtualUsbDevice>> out;
  out.reserve(devices_.size());
  for (const auto &kv : devices_) out.push_back(kv.second);
  return out;
}

size_t LocalDeviceTable::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

}  // namespace agent
}  // namespace usb_broker
