#include "usb_broker/agent/device_backend.hpp"

namespace usb_broker {
namespace agent {

namespace {
constexpr uint32_t kHubClass = 0x09;
}

bool MatchesFilters(const broker::v1::DeviceDescriptor &descriptor,
                    const std::vector<DeviceFilter> &filters) {
  if (descriptor.device_class() == kHubClass) return false;
  if (filters.empty()) return true;
  for (const auto &f : filters) {
    if (f.vendor_id != 0 && f.vendor_id != descriptor.vendor_id()) continue;
    if (f.product_id != 0 && f.product_id != descriptor.product_id()) continue;
    if (f.device_class >= 0 &&
        static_cast<uint32_t>(f.device_class) != descriptor.device_class()) {
      continue;
    }
    return true;
  }
  return false;
}

broker::v1::UsbSpeed ParseUsbSpeed(const std::string &text) {
  // sysfs 的 speed 属性单位为 Mbps; 配置文件里也接受名字
  if (text == "low" || text == "1.5") return broker::v1::USB_SPEED_LOW;
  if (text == "full" || text == "12") return broker::v1::USB_SPEED_FULL;
  if (text == "high" || text == "480") return broker::v1::USB_SPEED_HIGH;
  if (text == "super" || text == "5000") return broker::v1::USB_SPEED_SUPER;
  if (text == "super_plus" || text == "10000" || text == "20000") {
    return broker::v1::USB_SPEED_SUPER_PLUS;
  }
  return broker::v1::USB_SPEED_UNKNOWN;
}

bool ParseControlSetup(const std::string &setup, ControlSetup *out) {
  if (setup.size() != 8 || out == nullptr) return false;
  const auto *b = reinterpret_cast<const uint8_t *>(setup.data());
  out->request_type = b[0];
  out->request = b[1];
  out->value = static_cast<uint16_t>(b[2] | (b[3] << 8));
  out->index = static_cast<uint16_t>(b[4] | (b[5] << 8));
  out->length = static_cast<uint16_t>(b[6] | (b[7] << 8));
  return true;
}

std::string EncodeControlSetup(const ControlSetup &setup) {
  std::string out(8, '\0');
  out[0] = static_cast<char>(setup.request_type);
  out[1] = static_cast<char>(setup.request);
  out[2] = static_cast<char>(setup.value & 0xff);
  out[3] = static_cast<char>(setup.value >> 8);
  out[4] = static_cast<char>(setup.index & 0xff);
  out[5] = static_cast<char>(setup.index >> 8);
  out[6] = static_cast<char>(setup.length & 0xff);
  out[7] = static_cast<char>(setup.length >> 8);
  return out;
}

broker::v1::TransferFrame MakeCompletion(const broker::v1::TransferFrame &submit,
                                         broker::v1::TransferStatus status) {
  broker::v1::TransferFrame done;
  done.set_type(submit.type());
  done.set_endpoint(submit.endpoint());
  done.set_direction(submit.direction());
  done.set_sequence(submit.sequence());
  done.set_status(status);
  return done;
}

}  // namespace agent
}  // namespace usb_broker
