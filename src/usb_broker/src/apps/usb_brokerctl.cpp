// usb_brokerctl: 运维命令行
// 查看设备 / 强制回收 / 查看事件

#include "usb_broker/cli/brokerctl.hpp"
#include "usb_broker/common/log.hpp"

#include <iostream>

int main(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  for (const auto &arg : args) {
    if (arg == "--help" || arg == "-h") {
      usb_broker::cli::PrintUsage(std::cout);
      return usb_broker::cli::kExitOk;
    }
  }

  // 命令行输出只走 stdout/stderr
  usb_broker::SetLogLevel(usb_broker::LogLevel::kError);

  usb_broker::cli::CliOptions options;
  std::string error;
  if (!usb_broker::cli::ParseArgs(args, &options, &error)) {
    std::cerr << "usage error: " << error << "\n";
    usb_broker::cli::PrintUsage(std::cerr);
    return usb_broker::cli::kExitUsage;
  }

  usb_broker::agent::BrokerClient client(
      usb_broker::agent::BrokerClient::MakeChannel(options.broker_address,
                                                   options.root_cert_path),
      std::chrono::milliseconds(options.timeout_ms));
  return usb_broker::cli::RunCommand(client, options, std::cout, std::cerr);
}
