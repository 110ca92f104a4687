#include "usb_broker/agent/linux_usbfs_backend.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <linux/netlink.h>
#include <linux/usbdevice_fs.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace usb_broker {
namespace agent {

namespace {

std::string ReadAttr(const fs::path &dir, const char *name) {
  return TrimWhitespace(ReadFileToString((dir / name).string()));
}

uint32_t ReadHexAttr(const fs::path &dir, const char *name) {
  const std::string s = ReadAttr(dir, name);
  return s.empty() ? 0 : static_cast<uint32_t>(std::strtoul(s.c_str(), nullptr, 16));
}

uint32_t ReadDecAttr(const fs::path &dir, const char *name) {
  const std::string s = ReadAttr(dir, name);
  return s.empty() ? 0 : static_cast<uint32_t>(std::strtoul(s.c_str(), nullptr, 10));
}

broker::v1::TransferStatus StatusFromErrno(int err) {
  switch (err) {
    case EPIPE:     return broker::v1::TRANSFER_STATUS_STALL;
    case ETIMEDOUT: return broker::v1::TRANSFER_STATUS_TIMEOUT;
    case EOVERFLOW: return broker::v1::TRANSFER_STATUS_OVERFLOW;
    case ENOENT:
    case ECONNRESET: return broker::v1::TRANSFER_STATUS_CANCELLED;
    case ENODEV:
    case ESHUTDOWN: return broker::v1::TRANSFER_STATUS_DEVICE_GONE;
    default:        return broker::v1::TRANSFER_STATUS_ERROR;
  }
}

int DisconnectDriver(int fd, unsigned int ifno) {
  struct usbdevfs_ioctl cmd;
  cmd.ifno = static_cast<int>(ifno);
  cmd.ioctl_code = USBDEVFS_DISCONNECT;
  cmd.data = nullptr;
  return ioctl(fd, USBDEVFS_IOCTL, &cmd);
}

int ConnectDriver(int fd, unsigned int ifno) {
  struct usbdevfs_ioctl cmd;
  cmd.ifno = static_cast<int>(ifno);
  cmd.ioctl_code = USBDEVFS_CONNECT;
  cmd.data = nullptr;
  return ioctl(fd, USBDEVFS_IOCTL, &cmd);
}

}  // namespace

LinuxUsbfsBackend::ClaimedDevice::~ClaimedDevice() {
  if (fd >= 0) ::close(fd);
}

LinuxUsbfsBackend::LinuxUsbfsBackend(std::string sysfs_root,
                                     std::string devfs_root)
    : sysfs_root_(std::move(sysfs_root)), devfs_root_(std::move(devfs_root)) {}

LinuxUsbfsBackend::~LinuxUsbfsBackend() {
  StopHotplug();
  std::vector<std::string> buses;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &kv : claimed_) buses.push_back(kv.first);
  }
  for (const auto &bus : buses) {
    if (Release(bus) != BrokerError::kOk) {
      LogWarn("UsbfsBackend: release of %s on shutdown failed", bus.c_str());
    }
  }
}

// ──────────────── 枚举 ────────────────

bool LinuxUsbfsBackend::ReadDescriptor(const std::string &bus_path,
                                       broker::v1::DeviceDescriptor *out) const {
  const fs::path dir = fs::path(sysfs_root_) / bus_path;
  std::error_code ec;
  if (!fs::exists(dir / "idVendor", ec)) return false;

  broker::v1::DeviceDescriptor d;
  d.set_bus_path(bus_path);
  d.set_busnum(ReadDecAttr(dir, "busnum"));
  d.set_devnum(ReadDecAttr(dir, "devnum"));
  d.set_vendor_id(ReadHexAttr(dir, "idVendor"));
  d.set_product_id(ReadHexAttr(dir, "idProduct"));
  d.set_bcd_device(ReadHexAttr(dir, "bcdDevice"));
  d.set_device_class(ReadHexAttr(dir, "bDeviceClass"));
  d.set_device_subclass(ReadHexAttr(dir, "bDeviceSubClass"));
  d.set_device_protocol(ReadHexAttr(dir, "bDeviceProtocol"));
  d.set_speed(ParseUsbSpeed(ReadAttr(dir, "speed")));
  d.set_serial(ReadAttr(dir, "serial"));
  d.set_manufacturer(ReadAttr(dir, "manufacturer"));
  d.set_product(ReadAttr(dir, "product"));
  d.set_num_configurations(ReadDecAttr(dir, "bNumConfigurations"));
  d.set_num_interfaces(ReadDecAttr(dir, "bNumInterfaces"));
  if (out) *out = std::move(d);
  return true;
}

std::vector<broker::v1::DeviceDescriptor> LinuxUsbfsBackend::Enumerate() {
  std::vector<broker::v1::DeviceDescriptor> result;
  std::error_code ec;
  fs::directory_iterator it(sysfs_root_, ec);
  if (ec) {
    LogError("UsbfsBackend: cannot read %s: %s", sysfs_root_.c_str(),
             ec.message().c_str());
    return result;
  }
  for (const auto &entry : it) {
    const std::string name = entry.path().filename().string();
    // 接口节点 "1-2:1.0" 与根 hub "usb1" 跳过
    if (name.find(':') != std::string::npos || name.rfind("usb", 0) == 0) {
      continue;
    }
    if (!IsValidBusPath(name)) continue;
    broker::v1::DeviceDescriptor d;
    if (ReadDescriptor(name, &d)) result.push_back(std::move(d));
  }
  return result;
}

std::vector<unsigned int>
LinuxUsbfsBackend::InterfaceNumbers(const std::string &bus_path) const {
  std::vector<unsigned int> result;
  std::error_code ec;
  fs::directory_iterator it(fs::path(sysfs_root_) / bus_path, ec);
  if (ec) return result;
  const std::string prefix = bus_path + ":";
  for (const auto &entry : it) {
    const std::string name = entry.path().filename().string();
    if (name.rfind(prefix, 0) != 0) continue;
    const std::string num = ReadAttr(entry.path(), "bInterfaceNumber");
    if (num.empty()) continue;
    result.push_back(static_cast<unsigned int>(std::strtoul(num.c_str(), nullptr, 16)));
  }
  return result;
}

// ──────────────── claim / release ────────────────

BrokerError LinuxUsbfsBackend::Claim(const std::string &bus_path) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (claimed_.count(bus_path)) return BrokerError::kBusy;
  }

  broker::v1::DeviceDescriptor d;
  if (!ReadDescriptor(bus_path, &d)) return BrokerError::kNotFound;

  char node[64];
  std::snprintf(node, sizeof(node), "/%03u/%03u", d.busnum(), d.devnum());
  const std::string path = devfs_root_ + node;

  auto dev = std::make_shared<ClaimedDevice>();
  dev->fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
  if (dev->fd < 0) {
    LogError("UsbfsBackend: open %s failed: %s", path.c_str(), std::strerror(errno));
    return errno == ENOENT ? BrokerError::kNotFound : BrokerError::kInternal;
  }

  for (unsigned int ifno : InterfaceNumbers(bus_path)) {
    // ENODATA = 没有驱动绑定
    if (DisconnectDriver(dev->fd, ifno) < 0 && errno != ENODATA) {
      LogWarn("UsbfsBackend: detach driver %s if%u: %s", bus_path.c_str(),
              ifno, std::strerror(errno));
    }
    if (ioctl(dev->fd, USBDEVFS_CLAIMINTERFACE, &ifno) < 0) {
      const int err = errno;
      LogError("UsbfsBackend: claim %s if%u failed: %s", bus_path.c_str(),
               ifno, std::strerror(err));
      for (unsigned int claimed : dev->interfaces) {
        ioctl(dev->fd, USBDEVFS_RELEASEINTERFACE, &claimed);
        ConnectDriver(dev->fd, claimed);
      }
      ConnectDriver(dev->fd, ifno);
      return err == EBUSY ? BrokerError::kBusy : BrokerError::kInternal;
    }
    dev->interfaces.push_back(ifno);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (claimed_.count(bus_path)) return BrokerError::kBusy;
  claimed_[bus_path] = dev;
  LogInfo("UsbfsBackend: claimed %s (%zu interface(s))", bus_path.c_str(),
          dev->interfaces.size());
  return BrokerError::kOk;
}

BrokerError LinuxUsbfsBackend::Release(const std::string &bus_path) {
  std::shared_ptr<ClaimedDevice> dev;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = claimed_.find(bus_path);
    if (it == claimed_.end()) return BrokerError::kNotFound;
    dev = it->second;
    claimed_.erase(it);
  }

  BrokerError result = BrokerError::kOk;
  for (unsigned int ifno : dev->interfaces) {
    if (ioctl(dev->fd, USBDEVFS_RELEASEINTERFACE, &ifno) < 0 && errno != ENODEV) {
      LogWarn("UsbfsBackend: release %s if%u: %s", bus_path.c_str(), ifno,
              std::strerror(errno));
      result = BrokerError::kInternal;
    }
    if (ConnectDriver(dev->fd, ifno) < 0 && errno != ENODEV) {
      LogDebug("UsbfsBackend: reattach driver %s if%u: %s", bus_path.c_str(),
               ifno, std::strerror(errno));
    }
  }
  LogInfo("UsbfsBackend: released %s", bus_path.c_str());
  return result;
}

std::shared_ptr<LinuxUsbfsBackend::ClaimedDevice>
LinuxUsbfsBackend::Find(const std::string &bus_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = claimed_.find(bus_path);
  return it == claimed_.end() ? nullptr : it->second;
}

// ──────────────── 传输 ────────────────

broker::v1::TransferFrame
LinuxUsbfsBackend::Transfer(const std::string &bus_path,
                            const broker::v1::TransferFrame &submit) {
  auto dev = Find(bus_path);
  if (!dev) return MakeCompletion(submit, broker::v1::TRANSFER_STATUS_ERROR);

  const bool in = submit.direction() == broker::v1::DIRECTION_IN;

  if (submit.type() == broker::v1::TRANSFER_TYPE_CONTROL) {
    ControlSetup setup;
    if (!ParseControlSetup(submit.setup(), &setup)) {
      return MakeCompletion(submit, broker::v1::TRANSFER_STATUS_ERROR);
    }
    std::string buffer = in ? std::string(setup.length, '\0') : submit.payload();
    struct usbdevfs_ctrltransfer ctrl;
    std::memset(&ctrl, 0, sizeof(ctrl));
    ctrl.bRequestType = setup.request_type;
    ctrl.bRequest = setup.request;
    ctrl.wValue = setup.value;
    ctrl.wIndex = setup.index;
    ctrl.wLength = static_cast<uint16_t>(buffer.size());
    ctrl.timeout = submit.timeout_ms();
    ctrl.data = buffer.empty() ? nullptr : &buffer[0];

    const int rc = ioctl(dev->fd, USBDEVFS_CONTROL, &ctrl);
    if (rc < 0) return MakeCompletion(submit, StatusFromErrno(errno));
    auto done = MakeCompletion(submit, broker::v1::TRANSFER_STATUS_OK);
    done.set_actual_length(static_cast<uint32_t>(rc));
    if (in) {
      buffer.resize(static_cast<size_t>(rc));
      done.set_payload(std::move(buffer));
    }
    return done;
  }

  if (submit.type() == broker::v1::TRANSFER_TYPE_BULK ||
      submit.type() == broker::v1::TRANSFER_TYPE_INTERRUPT) {
    std::string buffer = in ? std::string(submit.length(), '\0') : submit.payload();
    struct usbdevfs_bulktransfer bulk;
    std::memset(&bulk, 0, sizeof(bulk));
    bulk.ep = submit.endpoint();
    bulk.len = static_cast<unsigned int>(buffer.size());
    bulk.timeout = submit.timeout_ms();
    bulk.data = buffer.empty() ? nullptr : &buffer[0];

    const int rc = ioctl(dev->fd, USBDEVFS_BULK, &bulk);
    if (rc < 0) return MakeCompletion(submit, StatusFromErrno(errno));
    auto done = MakeCompletion(submit, broker::v1::TRANSFER_STATUS_OK);
    done.set_actual_length(static_cast<uint32_t>(rc));
    if (in) {
      buffer.resize(static_cast<size_t>(rc));
      done.set_payload(std::move(buffer));
    }
    return done;
  }

  // 等时传输需要 URB 异步接口, 当前不支持
  LogWarn("UsbfsBackend: isochronous transfer on %s rejected", bus_path.c_str());
  return MakeCompletion(submit, broker::v1::TRANSFER_STATUS_ERROR);
}

// ──────────────── 热插拔 ────────────────

bool LinuxUsbfsBackend::StartHotplug(HotplugCallback callback) {
  if (hotplug_running_.load()) return true;

  netlink_fd_ = ::socket(AF_NETLINK, SOCK_RAW | SOCK_CLOEXEC, NETLINK_KOBJECT_UEVENT);
  if (netlink_fd_ < 0) {
    LogError("UsbfsBackend: netlink socket: %s", std::strerror(errno));
    return false;
  }
  struct sockaddr_nl addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.nl_family = AF_NETLINK;
  addr.nl_groups = 1;  // kernel uevent 组
  if (::bind(netlink_fd_, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0) {
    LogError("UsbfsBackend: netlink bind: %s", std::strerror(errno));
    ::close(netlink_fd_);
    netlink_fd_ = -1;
    return false;
  }
  if (::pipe2(control_pipe_, O_CLOEXEC) < 0) {
    LogError("UsbfsBackend: control pipe: %s", std::strerror(errno));
    ::close(netlink_fd_);
    netlink_fd_ = -1;
    return false;
  }

  hotplug_ = std::move(callback);
  hotplug_running_.store(true);
  hotplug_thread_ = std::thread([this] { HotplugLoop(); });
  LogInfo("UsbfsBackend: hotplug monitor started");
  return true;
}

void LinuxUsbfsBackend::StopHotplug() {
  if (!hotplug_running_.exchange(false)) return;
  const char c = 'q';
  if (::write(control_pipe_[1], &c, 1) < 0) {
    LogWarn("UsbfsBackend: wake hotplug thread: %s", std::strerror(errno));
  }
  if (hotplug_thread_.joinable()) hotplug_thread_.join();
  ::close(control_pipe_[0]);
  ::close(control_pipe_[1]);
  control_pipe_[0] = control_pipe_[1] = -1;
  ::close(netlink_fd_);
  netlink_fd_ = -1;
}

void LinuxUsbfsBackend::HotplugLoop() {
  char buf[8192];
  while (hotplug_running_.load()) {
    struct pollfd fds[2];
    fds[0].fd = netlink_fd_;
    fds[0].events = POLLIN;
    fds[1].fd = control_pipe_[0];
    fds[1].events = POLLIN;
    const int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (errno == EINTR) continue;
      LogError("UsbfsBackend: poll: %s", std::strerror(errno));
      break;
    }
    if (fds[1].revents & POLLIN) break;
    if (!(fds[0].revents & POLLIN)) continue;

    const ssize_t len = ::recv(netlink_fd_, buf, sizeof(buf) - 1, 0);
    if (len <= 0) continue;
    buf[len] = '\0';

    // "action@devpath\0KEY=VALUE\0..."
    std::string action, devpath, subsystem, devtype;
    for (ssize_t off = 0; off < len;) {
      const std::string field(buf + off);
      off += static_cast<ssize_t>(field.size()) + 1;
      if (field.rfind("ACTION=", 0) == 0) action = field.substr(7);
      else if (field.rfind("DEVPATH=", 0) == 0) devpath = field.substr(8);
      else if (field.rfind("SUBSYSTEM=", 0) == 0) subsystem = field.substr(10);
      else if (field.rfind("DEVTYPE=", 0) == 0) devtype = field.substr(8);
    }
    if (subsystem != "usb" || devtype != "usb_device") continue;

    const std::string bus_path = fs::path(devpath).filename().string();
    if (!IsValidBusPath(bus_path)) continue;

    HotplugEvent ev;
    ev.bus_path = bus_path;
    if (action == "add") {
      ev.kind = HotplugEvent::Kind::kAttached;
      if (!ReadDescriptor(bus_path, &ev.descriptor)) {
        LogWarn("UsbfsBackend: %s added but sysfs attributes missing",
                bus_path.c_str());
        continue;
      }
    } else if (action == "remove") {
      ev.kind = HotplugEvent::Kind::kDetached;
    } else {
      continue;
    }
    LogDebug("UsbfsBackend: uevent %s %s", action.c_str(), bus_path.c_str());
    if (hotplug_) hotplug_(ev);
  }
}

}  // namespace agent
}  // namespace usb_broker
