#include "my_error_codes.hpp"

#include <string>

namespace my_errors {

namespace {

class QbeeCategory : public boost::system::error_category {
 public:
  const char *name() const noexcept override { return "qbee"; }

  std::string message(int code) const override {
    switch (code) {
      case GENERAL::INVALID_ARGUMENT:
        return "invalid argument";
      case GENERAL::SHOW_OPT_DESC:
        return "show options description";
      case GENERAL::MISSING_FIELD:
        return "missing field";
      case GENERAL::UNEXPECTED_RESULT:
        return "unexpected result";
      case GENERAL::FILE_NOT_FOUND:
        return "file not found";
      case GENERAL::FILE_READ_WRITE:
        return "file read/write error";
      case GENERAL::JSON_PARSE_ERROR:
        return "JSON parse error";
      case GENERAL::API_ERROR:
        return "management API error";
      case GENERAL::CANCELLED:
        return "operation cancelled";
      case NETWORK::CONNECT_ERROR:
        return "connect error";
      case NETWORK::READ_ERROR:
        return "read error";
      case NETWORK::WRITE_ERROR:
        return "write error";
      case NETWORK::TIMEOUT_ERROR:
        return "timeout";
      case NETWORK::SSL_ERROR:
        return "TLS error";
      case TARGET::INVALID_FORMAT:
        return "invalid format";
      case TARGET::INVALID_LOCAL_PORT:
        return "invalid local port";
      case TARGET::INVALID_REMOTE_PORT:
        return "invalid remote port";
      case TARGET::INVALID_DEVICE_ID:
        return "invalid device id";
      case TARGET::STDIO_NOT_EXCLUSIVE:
        return "stdio is only supported for single target connections";
      case TARGET::NO_TARGETS:
        return "no targets defined for device";
      case TARGET::INVALID_RETRIES:
        return "retries must be a non-negative number";
      case DEVICE::LOOKUP_FAILED:
        return "device lookup failed";
      case DEVICE::REMOTE_ACCESS_UNAVAILABLE:
        return "remote access is not available";
      case DEVICE::NOT_FOUND:
        return "device not found";
      case DEVICE::AMBIGUOUS:
        return "multiple devices found";
      case TRANSPORT::SESSION_OPEN_FAILED:
        return "session establishment failed";
      case TRANSPORT::STREAM_OPEN_FAILED:
        return "stream open failed";
      case TRANSPORT::SESSION_CLOSED:
        return "session closed";
      case TRANSPORT::PROTOCOL_ERROR:
        return "unexpected message on stream";
      case TRANSPORT::REJECTED:
        return "request rejected by peer";
      case TRANSPORT::LEGACY_UNSUPPORTED:
        return "legacy remote access is not supported";
      case TUNNEL::BIND_FAILED:
        return "local bind failed";
      case TUNNEL::PORT_NOT_READY:
        return "local port never became ready";
      case TUNNEL::NO_FREE_PORT:
        return "no free local port";
      case TUNNEL::TERMINAL_ERROR:
        return "terminal error";
      case AUTH::UNAUTHORIZED:
        return "unauthorized";
      case AUTH::LOGIN_FAILED:
        return "login failed";
      case AUTH::MISSING_CREDENTIALS:
        return "missing credentials";
      default:
        return "unknown qbee error " + std::to_string(code);
    }
  }
};

}  // namespace

const boost::system::error_category &qbee_category() noexcept {
  static const QbeeCategory category;
  return category;
}

}  // namespace my_errors
