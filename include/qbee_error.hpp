#pragma once

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <functional>
#include <ostream>
#include <string>
#include <utility>

#include "my_error_codes.hpp"

namespace qbeecli {

// Outcome of an asynchronous operation. A default constructed Error means
// success, the same way a clear error_code does.
struct Error {
  boost::system::error_code code;
  std::string what;

  explicit operator bool() const { return static_cast<bool>(code); }
  bool is(int qbee_code) const {
    return code.category() == my_errors::qbee_category() &&
           code.value() == qbee_code;
  }
};

inline Error make_error(int code, std::string what) {
  return Error{my_errors::make_error_code(code), std::move(what)};
}

inline Error make_error(boost::system::error_code ec, std::string what) {
  return Error{ec, std::move(what)};
}

inline std::ostream &operator<<(std::ostream &os, const Error &err) {
  os << err.what;
  if (err.code) {
    os << " (" << err.code.category().name() << ':' << err.code.value() << ')';
  }
  return os;
}

using Completion = std::function<void(Error)>;

enum class ErrorKind { none, parse, resolution, transport, tunnel, auth, other };

inline ErrorKind classify(const Error &err) {
  if (!err.code) {
    return ErrorKind::none;
  }
  if (err.code.category() != my_errors::qbee_category()) {
    return ErrorKind::other;
  }
  const int v = err.code.value();
  if (v >= 6000 && v < 6100) {
    return ErrorKind::parse;
  }
  if (v >= 6100 && v < 6200) {
    return ErrorKind::resolution;
  }
  if (v >= 6200 && v < 6300) {
    return ErrorKind::transport;
  }
  if (v >= 6300 && v < 6400) {
    return ErrorKind::tunnel;
  }
  if (v >= 6400 && v < 6500) {
    return ErrorKind::auth;
  }
  return ErrorKind::other;
}

// Thrown by the synchronous target and device identifier parsers.
class TargetParseError : public boost::system::system_error {
 public:
  TargetParseError(int code, const std::string &what)
      : boost::system::system_error(my_errors::make_error_code(code), what),
        message_(what) {}

  const std::string &message() const { return message_; }
  Error to_error() const { return Error{code(), message_}; }

 private:
  std::string message_;
};

}  // namespace qbeecli
