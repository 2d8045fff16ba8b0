#pragma once

#include <boost/system/error_code.hpp>

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int MISSING_FIELD = 5008;  // Missing field
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
constexpr int FILE_NOT_FOUND = 5019;  // File not found
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
constexpr int JSON_PARSE_ERROR = 5021;  // JSON parse error
constexpr int API_ERROR = 5023;  // Management API returned an error
constexpr int CANCELLED = 5024;  // Operation cancelled
}  // namespace GENERAL

namespace NETWORK {  // Network errors

constexpr int CONNECT_ERROR = 5200;  // Connect error
constexpr int READ_ERROR = 5201;  // Read error
constexpr int WRITE_ERROR = 5202;  // Write error
constexpr int TIMEOUT_ERROR = 5203;  // Timeout error
constexpr int SSL_ERROR = 5204;  // SSL error
}  // namespace NETWORK

namespace TARGET {  // Target and device identifier parse errors

constexpr int INVALID_FORMAT = 6000;  // Invalid target format
constexpr int INVALID_LOCAL_PORT = 6001;  // Invalid local port
constexpr int INVALID_REMOTE_PORT = 6002;  // Invalid remote port
constexpr int INVALID_DEVICE_ID = 6003;  // Invalid device identifier
constexpr int STDIO_NOT_EXCLUSIVE = 6004;  // stdio mixed with other targets
constexpr int NO_TARGETS = 6005;  // No targets defined for device
constexpr int INVALID_RETRIES = 6006;  // Negative retry count
}  // namespace TARGET

namespace DEVICE {  // Device resolution errors

constexpr int LOOKUP_FAILED = 6100;  // Device status lookup failed
constexpr int REMOTE_ACCESS_UNAVAILABLE = 6101;  // Remote access disabled
constexpr int NOT_FOUND = 6102;  // Device not found
constexpr int AMBIGUOUS = 6103;  // Multiple devices found
}  // namespace DEVICE

namespace TRANSPORT {  // Session and stream errors

constexpr int SESSION_OPEN_FAILED = 6200;  // Session establishment failed
constexpr int STREAM_OPEN_FAILED = 6201;  // Stream open failed
constexpr int SESSION_CLOSED = 6202;  // Session closed by remote side
constexpr int PROTOCOL_ERROR = 6203;  // Unexpected message on a stream
constexpr int REJECTED = 6204;  // Peer answered with an error message
constexpr int LEGACY_UNSUPPORTED = 6205;  // Legacy edge not supported
}  // namespace TRANSPORT

namespace TUNNEL {  // Local tunnel endpoint errors

constexpr int BIND_FAILED = 6300;  // Local listener bind failed
constexpr int PORT_NOT_READY = 6301;  // Local port never became ready
constexpr int NO_FREE_PORT = 6302;  // Could not allocate a local port
constexpr int TERMINAL_ERROR = 6303;  // Local terminal unavailable
}  // namespace TUNNEL

namespace AUTH {  // Authentication errors

constexpr int UNAUTHORIZED = 6400;  // Missing or wrong broker token
constexpr int LOGIN_FAILED = 6401;  // Management API login failed
constexpr int MISSING_CREDENTIALS = 6402;  // No credentials configured
}  // namespace AUTH

// Error category carrying the codes above inside boost::system::error_code.
const boost::system::error_category &qbee_category() noexcept;

inline boost::system::error_code make_error_code(int code) noexcept {
  return boost::system::error_code(code, qbee_category());
}

}  // namespace my_errors
