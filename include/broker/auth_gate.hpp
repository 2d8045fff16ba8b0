#pragma once

#include <boost/beast/http/fields.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace qbeecli::broker {

inline constexpr std::string_view kAuthHeader = "X-Qbee-Authorization";
inline constexpr std::string_view kSessionCookie = "session_token";

// Compares secrets in time independent of where they first differ.
bool TokensEqual(std::string_view presented, std::string_view expected);

// Access check in front of the proxy. Without a configured token every
// request passes. Otherwise the X-Qbee-Authorization header must carry the
// token; such a request is also issued a session cookie so a browser can
// leave the header out afterwards.
class AuthGate {
 public:
  using Clock = std::chrono::steady_clock;

  struct Decision {
    bool allowed{false};
    // Set-Cookie value for a freshly issued session.
    std::optional<std::string> set_cookie;
  };

  AuthGate(std::string token, std::chrono::seconds session_ttl)
      : token_(std::move(token)), session_ttl_(session_ttl) {}

  bool enabled() const { return !token_.empty(); }

  Decision check(const boost::beast::http::fields &headers,
                 Clock::time_point now = Clock::now());

  std::size_t session_count() const;

 private:
  std::string IssueSession(Clock::time_point now);
  bool HasValidSession(std::string_view cookie_header, Clock::time_point now);

  std::string token_;
  std::chrono::seconds session_ttl_;
  mutable std::mutex mutex_;
  std::map<std::string, Clock::time_point> sessions_;
};

// Value of one cookie in a Cookie header, if present.
std::optional<std::string> FindCookie(std::string_view cookie_header,
                                      std::string_view name);

}  // namespace qbeecli::broker
