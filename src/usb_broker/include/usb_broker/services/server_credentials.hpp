#pragma once

#include <memory>
#include <string>

#include "grpcpp/grpcpp.h"

namespace usb_broker {
namespace services {

/// cert / key 都配置且可读时启用 TLS, 否则回落到明文
std::shared_ptr<grpc::ServerCredentials>
MakeServerCredentials(const std::string &tls_cert_path,
                      const std::string &tls_key_path);

} // namespace services
} // namespace usb_broker
