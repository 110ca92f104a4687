#include "usb_broker/common/error.hpp"

#include <grpcpp/grpcpp.h>

namespace usb_broker {

const char *ToString(BrokerError error) {
  switch (error) {
    case BrokerError::kOk:               return "OK";
    case BrokerError::kNotFound:         return "NOT_FOUND";
    case BrokerError::kBusy:             return "BUSY";
    case BrokerError::kExpired:          return "EXPIRED";
    case BrokerError::kInvalidToken:     return "INVALID_TOKEN";
    case BrokerError::kUnreachable:      return "UNREACHABLE";
    case BrokerError::kDeviceRemoved:    return "DEVICE_REMOVED";
    case BrokerError::kAlreadyFree:      return "ALREADY_FREE";
    case BrokerError::kUnauthenticated:  return "UNAUTHENTICATED";
    case BrokerError::kInvalidArgument:  return "INVALID_ARGUMENT";
    case BrokerError::kCancelled:        return "CANCELLED";
    case BrokerError::kInternal:         return "INTERNAL";
  }
  return "UNKNOWN";
}

broker::v1::ErrorCode ToProto(BrokerError error) {
  switch (error) {
    case BrokerError::kOk:               return broker::v1::ERROR_CODE_OK;
    case BrokerError::kNotFound:         return broker::v1::ERROR_CODE_NOT_FOUND;
    case BrokerError::kBusy:             return broker::v1::ERROR_CODE_BUSY;
    case BrokerError::kExpired:          return broker::v1::ERROR_CODE_EXPIRED;
    case BrokerError::kInvalidToken:     return broker::v1::ERROR_CODE_INVALID_TOKEN;
    case BrokerError::kUnreachable:      return broker::v1::ERROR_CODE_UNREACHABLE;
    case BrokerError::kDeviceRemoved:    return broker::v1::ERROR_CODE_DEVICE_REMOVED;
    case BrokerError::kAlreadyFree:      return broker::v1::ERROR_CODE_ALREADY_FREE;
    case BrokerError::kUnauthenticated:  return broker::v1::ERROR_CODE_UNAUTHENTICATED;
    case BrokerError::kInvalidArgument:  return broker::v1::ERROR_CODE_INVALID_ARGUMENT;
    case BrokerError::kCancelled:        return broker::v1::ERROR_CODE_CANCELLED;
    case BrokerError::kInternal:         return broker::v1::ERROR_CODE_INTERNAL;
  }
  return broker::v1::ERROR_CODE_INTERNAL;
}

BrokerError FromProto(broker::v1::ErrorCode code) {
  switch (code) {
    case broker::v1::ERROR_CODE_OK:               return BrokerError::kOk;
    case broker::v1::ERROR_CODE_NOT_FOUND:        return BrokerError::kNotFound;
    case broker::v1::ERROR_CODE_BUSY:             return BrokerError::kBusy;
    case broker::v1::ERROR_CODE_EXPIRED:          return BrokerError::kExpired;
    case broker::v1::ERROR_CODE_INVALID_TOKEN:    return BrokerError::kInvalidToken;
    case broker::v1::ERROR_CODE_UNREACHABLE:      return BrokerError::kUnreachable;
    case broker::v1::ERROR_CODE_DEVICE_REMOVED:   return BrokerError::kDeviceRemoved;
    case broker::v1::ERROR_CODE_ALREADY_FREE:     return BrokerError::kAlreadyFree;
    case broker::v1::ERROR_CODE_UNAUTHENTICATED:  return BrokerError::kUnauthenticated;
    case broker::v1::ERROR_CODE_INVALID_ARGUMENT: return BrokerError::kInvalidArgument;
    case broker::v1::ERROR_CODE_CANCELLED:        return BrokerError::kCancelled;
    default:                                      return BrokerError::kInternal;
  }
}

BrokerError FromGrpcStatus(const grpc::Status &status) {
  switch (status.error_code()) {
    case grpc::StatusCode::OK:                return BrokerError::kOk;
    case grpc::StatusCode::UNAVAILABLE:
    case grpc::StatusCode::DEADLINE_EXCEEDED: return BrokerError::kUnreachable;
    case grpc::StatusCode::UNAUTHENTICATED:
    case grpc::StatusCode::PERMISSION_DENIED: return BrokerError::kUnauthenticated;
    case grpc::StatusCode::NOT_FOUND:         return BrokerError::kNotFound;
    case grpc::StatusCode::CANCELLED:         return BrokerError::kCancelled;
    case grpc::StatusCode::INVALID_ARGUMENT:  return BrokerError::kInvalidArgument;
    default:                                  return BrokerError::kInternal;
  }
}

void FillResponseBase(BrokerError error, const std::string &message,
                      broker::v1::ResponseBase *base) {
  if (base == nullptr) return;
  base->set_error_code(ToProto(error));
  if (!message.empty()) {
    base->set_error_message(message);
  } else if (error != BrokerError::kOk) {
    base->set_error_message(ToString(error));
  }
}

} // namespace usb_broker
