#include "usb_broker/services/server_credentials.hpp"
#include "usb_broker/common/log.hpp"
#include "usb_broker/common/utils.hpp"

#include <grpcpp/security/server_credentials.h>

namespace usb_broker {
namespace services {

std::shared_ptr<grpc::ServerCredentials>
MakeServerCredentials(const std::string &tls_cert_path,
                      const std::string &tls_key_path) {
  if (tls_cert_path.empty() || tls_key_path.empty()) {
    return grpc::InsecureServerCredentials();
  }
  const std::string cert = ReadFileToString(tls_cert_path);
  const std::string key = ReadFileToString(tls_key_path);
  if (cert.empty() || key.empty()) {
    LogWarn("TLS cert/key empty, falling back to insecure");
    return grpc::InsecureServerCredentials();
  }
  grpc::SslServerCredentialsOptions ssl_opts;
  ssl_opts.pem_key_cert_pairs.push_back({key, cert});
  LogInfo("TLS enabled");
  return grpc::SslServerCredentials(ssl_opts);
}

} // namespace services
} // namespace usb_broker
