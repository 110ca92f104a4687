#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "usb_broker/agent/broker_client.hpp"
#include "usb_broker/common/error.hpp"

namespace usb_broker {
namespace cli {

// 进程退出码
constexpr int kExitOk = 0;
constexpr int kExitNotFound = 2;
constexpr int kExitAlreadyFree = 3;
constexpr int kExitUnreachable = 4;
constexpr int kExitError = 5;
constexpr int kExitUsage = 64;

struct CliOptions {
  std::string broker_address = "127.0.0.1:50061";
  std::string root_cert_path;
  uint32_t timeout_ms = 3000;
  std::vector<std::string> command;  // 全局选项之后的部分
};

int ExitCodeFor(BrokerError error);

/// 解析全局选项. 失败时写入 error 并返回 false
bool ParseArgs(const std::vector<std::string> &args, CliOptions *options,
               std::string *error);

/// 执行一条子命令, 返回退出码
int RunCommand(agent::BrokerClient &client, const CliOptions &options,
               std::ostream &out, std::ostream &err);

void PrintUsage(std::ostream &out);

}  // namespace cli
}  // namespace usb_broker
