#pragma once

#include "common.pb.h"

namespace grpc {
class Status;
}

namespace usb_broker {

/// 全局错误分类. 所有跨模块调用以返回值形式报告, 结果写入输出指针.
///
///   kNotFound        未知设备/租约引用, 不重试
///   kBusy            设备已被租用 (或仍在解绑), 由调用方决定是否退避重试
///   kExpired         租约已过期, 必须重新 acquire
///   kInvalidToken    令牌陈旧/伪造/已被撤销, 必须重新 acquire
///   kUnreachable     Host Agent / Export Agent / Broker 无响应, 附 retry-after
///   kDeviceRemoved   会话期间设备被物理拔出, 不自动重试
///   kAlreadyFree     revoke 时设备本来就空闲
enum class BrokerError {
  kOk = 0,
  kNotFound,
  kBusy,
  kExpired,
  kInvalidToken,
  kUnreachable,
  kDeviceRemoved,
  kAlreadyFree,
  kUnauthenticated,
  kInvalidArgument,
  kCancelled,
  kInternal,
};

const char *ToString(BrokerError error);

broker::v1::ErrorCode ToProto(BrokerError error);
BrokerError FromProto(broker::v1::ErrorCode code);

// gRPC 传输层失败 → 错误分类 (UNAVAILABLE / DEADLINE_EXCEEDED → kUnreachable)
BrokerError FromGrpcStatus(const grpc::Status &status);

// 在 ResponseBase 中写入错误码和可读消息
void FillResponseBase(BrokerError error, const std::string &message,
                      broker::v1::ResponseBase *base);

} // namespace usb_broker
