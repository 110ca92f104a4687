#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include "common.pb.h"

namespace usb_broker {
namespace testing_util {

inline broker::v1::DeviceDescriptor MakeDescriptor(const std::string &bus_path,
                                                   uint32_t vid = 0x18d1,
                                                   uint32_t pid = 0x4ee7) {
  broker::v1::DeviceDescriptor d;
  d.set_bus_path(bus_path);
  d.set_vendor_id(vid);
  d.set_product_id(pid);
  d.set_serial("SN-" + bus_path);
  d.set_product("Test Device");
  d.set_speed(broker::v1::USB_SPEED_HIGH);
  return d;
}

// Polls `cond` until it holds or `timeout` passes.
inline bool WaitUntil(const std::function<bool()> &cond,
                      std::chrono::milliseconds timeout =
                          std::chrono::milliseconds(3000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cond()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return cond();
}

}  // namespace testing_util
}  // namespace usb_broker
