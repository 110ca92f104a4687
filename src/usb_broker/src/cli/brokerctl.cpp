#include "usb_broker/cli/brokerctl.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>

#include "usb_broker/core/device_registry.hpp"

namespace usb_broker {
namespace cli {

namespace {

bool StartsWith(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

bool ParseStateFilter(const std::string &name, broker::v1::DeviceState *state) {
  if (name == "free") { *state = broker::v1::DEVICE_STATE_FREE; return true; }
  if (name == "bound") { *state = broker::v1::DEVICE_STATE_BOUND; return true; }
  if (name == "leased") { *state = broker::v1::DEVICE_STATE_LEASED; return true; }
  if (name == "unreachable") {
    *state = broker::v1::DEVICE_STATE_UNREACHABLE;
    return true;
  }
  return false;
}

std::string HexId(uint32_t value) {
  std::ostringstream os;
  os << std::hex << std::setw(4) << std::setfill('0') << value;
  return os.str();
}

void PrintDeviceLine(const broker::v1::DeviceSummary &d, std::ostream &out) {
  out << d.device_id() << "  " << d.host_id() << "  "
      << HexId(d.device_descriptor().vendor_id()) << ":"
      << HexId(d.device_descriptor().product_id()) << "  "
      << core::DeviceStateName(d.state());
  if (!d.lease_consumer().empty()) out << "  consumer=" << d.lease_consumer();
  out << "\n";
}

void PrintDeviceDetail(const broker::v1::DeviceSummary &d, std::ostream &out) {
  const auto &desc = d.device_descriptor();
  out << "device_id:    " << d.device_id() << "\n"
      << "host_id:      " << d.host_id() << "\n"
      << "bus_path:     " << desc.bus_path() << "\n"
      << "vid:pid:      " << HexId(desc.vendor_id()) << ":"
      << HexId(desc.product_id()) << "\n"
      << "serial:       " << desc.serial() << "\n"
      << "product:      " << desc.manufacturer() << " " << desc.product() << "\n"
      << "speed:        " << broker::v1::UsbSpeed_Name(desc.speed()) << "\n"
      << "state:        " << core::DeviceStateName(d.state()) << "\n";
  if (!d.lease_consumer().empty()) {
    out << "consumer:     " << d.lease_consumer() << "\n"
        << "generation:   " << d.lease_generation() << "\n"
        << "session:      " << (d.session_active() ? "active" : "none") << "\n";
  }
}

int Fail(BrokerError error, const std::string &message, std::ostream &err) {
  err << "error: " << ToString(error);
  if (!message.empty()) err << ": " << message;
  err << "\n";
  return ExitCodeFor(error);
}

int Usage(const std::string &message, std::ostream &err) {
  err << "usage error: " << message << "\n";
  PrintUsage(err);
  return kExitUsage;
}

// ──────────────── device 子命令 ────────────────

int DeviceList(agent::BrokerClient &client, const std::vector<std::string> &args,
               std::ostream &out, std::ostream &err) {
  broker::v1::ListDevicesRequest filter;
  for (size_t i = 2; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (StartsWith(arg, "--state=")) {
      broker::v1::DeviceState state;
      if (!ParseStateFilter(arg.substr(8), &state)) {
        return Usage("unknown state '" + arg.substr(8) + "'", err);
      }
      filter.set_state(state);
    } else if (StartsWith(arg, "--host=")) {
      filter.set_host_id(arg.substr(7));
    } else {
      return Usage("unexpected argument '" + arg + "'", err);
    }
  }

  std::vector<broker::v1::DeviceSummary> devices;
  std::string message;
  BrokerError rc = client.ListDevices(filter, &devices, &message);
  if (rc != BrokerError::kOk) return Fail(rc, message, err);

  for (const auto &d : devices) PrintDeviceLine(d, out);
  return kExitOk;
}

int DeviceGet(agent::BrokerClient &client, const std::vector<std::string> &args,
              std::ostream &out, std::ostream &err) {
  if (args.size() != 3) return Usage("device get <id>", err);

  broker::v1::DeviceSummary device;
  std::string message;
  BrokerError rc = client.GetDevice(args[2], &device, &message);
  if (rc != BrokerError::kOk) return Fail(rc, message, err);

  PrintDeviceDetail(device, out);
  return kExitOk;
}

int DeviceRevoke(agent::BrokerClient &client,
                 const std::vector<std::string> &args, std::ostream &out,
                 std::ostream &err) {
  std::string device_id;
  std::string reason;
  for (size_t i = 2; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (StartsWith(arg, "--reason=")) {
      reason = arg.substr(9);
    } else if (!StartsWith(arg, "--") && device_id.empty()) {
      device_id = arg;
    } else {
      return Usage("unexpected argument '" + arg + "'", err);
    }
  }
  if (device_id.empty()) return Usage("device revoke <id> --reason=<text>", err);

  std::string consumer;
  std::string message;
  BrokerError rc = client.RevokeDevice(device_id, reason, &consumer, &message);
  if (rc != BrokerError::kOk) return Fail(rc, message, err);

  out << "revoked " << device_id;
  if (!consumer.empty()) out << " (consumer " << consumer << ")";
  out << "\n";
  return kExitOk;
}

// ──────────────── events ────────────────

int Events(agent::BrokerClient &client, const CliOptions &options,
           std::ostream &out, std::ostream &err) {
  const auto &args = options.command;
  broker::v1::EventStreamRequest request;
  for (size_t i = 1; i < args.size(); ++i) {
    if (args[i] == "--follow" || args[i] == "-f") {
      request.set_follow(true);
    } else if (StartsWith(args[i], "--device=")) {
      request.set_device_id(args[i].substr(9));
    } else {
      return Usage("unexpected argument '" + args[i] + "'", err);
    }
  }

  // follow 模式不设截止时间
  std::chrono::milliseconds timeout =
      request.follow() ? std::chrono::milliseconds(0)
                       : std::chrono::milliseconds(options.timeout_ms);
  BrokerError rc = client.StreamEvents(
      request,
      [&out](const broker::v1::Event &ev) {
        out << ev.event_id() << "  "
            << broker::v1::EventSeverity_Name(ev.severity()) << "  "
            << broker::v1::EventType_Name(ev.type()) << "  ";
        if (!ev.device_id().empty()) out << ev.device_id() << "  ";
        out << ev.title() << "\n";
        out.flush();
        return true;
      },
      timeout);
  if (rc != BrokerError::kOk) return Fail(rc, "", err);
  return kExitOk;
}

}  // namespace

int ExitCodeFor(BrokerError error) {
  switch (error) {
    case BrokerError::kOk:          return kExitOk;
    case BrokerError::kNotFound:    return kExitNotFound;
    case BrokerError::kAlreadyFree: return kExitAlreadyFree;
    case BrokerError::kUnreachable: return kExitUnreachable;
    case BrokerError::kInvalidArgument: return kExitUsage;
    default:                        return kExitError;
  }
}

bool ParseArgs(const std::vector<std::string> &args, CliOptions *options,
               std::string *error) {
  size_t i = 0;
  for (; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--broker" || arg == "--timeout-ms" || arg == "--root-cert") {
      if (i + 1 >= args.size()) {
        *error = arg + " requires a value";
        return false;
      }
      const std::string &value = args[++i];
      if (arg == "--broker") {
        options->broker_address = value;
      } else if (arg == "--root-cert") {
        options->root_cert_path = value;
      } else {
        char *end = nullptr;
        long ms = std::strtol(value.c_str(), &end, 10);
        if (end == value.c_str() || *end != '\0' || ms <= 0) {
          *error = "invalid --timeout-ms '" + value + "'";
          return false;
        }
        options->timeout_ms = static_cast<uint32_t>(ms);
      }
    } else if (StartsWith(arg, "--")) {
      *error = "unknown option '" + arg + "'";
      return false;
    } else {
      break;
    }
  }

  options->command.assign(args.begin() + static_cast<long>(i), args.end());
  if (options->command.empty()) {
    *error = "missing command";
    return false;
  }
  return true;
}

int RunCommand(agent::BrokerClient &client, const CliOptions &options,
               std::ostream &out, std::ostream &err) {
  const auto &args = options.command;
  if (args.empty()) return Usage("missing command", err);

  if (args[0] == "events") return Events(client, options, out, err);

  if (args[0] != "device" || args.size() < 2) {
    return Usage("unknown command '" + args[0] + "'", err);
  }
  if (args[1] == "list") return DeviceList(client, args, out, err);
  if (args[1] == "get") return DeviceGet(client, args, out, err);
  if (args[1] == "revoke") return DeviceRevoke(client, args, out, err);
  return Usage("unknown device command '" + args[1] + "'", err);
}

void PrintUsage(std::ostream &out) {
  out << "Usage: usb_brokerctl [--broker host:port] [--timeout-ms N] "
         "[--root-cert <pem>] <command>\n"
         "\n"
         "Commands:\n"
         "  device list [--state=free|bound|leased|unreachable] [--host=<id>]\n"
         "  device get <id>\n"
         "  device revoke <id> --reason=<text>\n"
         "  events [--follow] [--device=<id>]\n"
         "\n"
         "Exit codes: 0 ok, 2 not found, 3 already free, 4 unreachable,\n"
         "            5 other error, 64 usage error\n";
}

}  // namespace cli
}  // namespace usb_broker
