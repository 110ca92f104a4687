#pragma once

#include <chrono>
#include <string>

#include "common.pb.h"
#include "usb_broker/common/error.hpp"
#include "usb_broker/core/idempotency_cache.hpp"

namespace usb_broker {
namespace services {

// 重复请求等待第一次执行结果的上限
constexpr std::chrono::milliseconds kDuplicateWait{2000};
constexpr uint32_t kDuplicateRetryAfterMs = 200;

/// 已有结果或第一次请求仍在执行时填好 response 并返回 true
template <typename Response>
bool AnswerDuplicate(const core::IdempotentCall &call, Response *response) {
  switch (call.admission()) {
    case core::Admission::kExecute:
      return false;
    case core::Admission::kReplay:
      if (response->ParseFromString(call.cached_response())) return true;
      response->Clear();
      return false;
    case core::Admission::kInFlight:
      response->mutable_base()->set_request_id(call.request_id());
      FillResponseBase(BrokerError::kUnreachable,
                       "duplicate request still in progress",
                       response->mutable_base());
      response->mutable_base()->set_retry_after_ms(kDuplicateRetryAfterMs);
      return true;
  }
  return false;
}

template <typename Response>
void RecordResult(core::IdempotentCall &call, const Response &response) {
  std::string resp_str;
  if (response.SerializeToString(&resp_str)) {
    call.Complete(std::move(resp_str));
  }
}

} // namespace services
} // namespace usb_broker
