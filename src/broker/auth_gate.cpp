#include "broker/auth_gate.hpp"

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <fmt/format.h>

#include <stdexcept>

namespace qbeecli::broker {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

std::string RandomToken() {
  unsigned char raw[32];
  if (RAND_bytes(raw, sizeof(raw)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  std::string out;
  out.reserve(sizeof(raw) * 2);
  for (unsigned char c : raw) {
    out += fmt::format("{:02x}", c);
  }
  return out;
}

}  // namespace

bool TokensEqual(std::string_view presented, std::string_view expected) {
  if (presented.size() != expected.size()) {
    return false;
  }
  return CRYPTO_memcmp(presented.data(), expected.data(), expected.size()) ==
         0;
}

std::optional<std::string> FindCookie(std::string_view cookie_header,
                                      std::string_view name) {
  while (!cookie_header.empty()) {
    const auto semi = cookie_header.find(';');
    auto pair = Trim(cookie_header.substr(0, semi));
    cookie_header = semi == std::string_view::npos
                        ? std::string_view{}
                        : cookie_header.substr(semi + 1);
    const auto eq = pair.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    if (Trim(pair.substr(0, eq)) == name) {
      return std::string(Trim(pair.substr(eq + 1)));
    }
  }
  return std::nullopt;
}

AuthGate::Decision AuthGate::check(const boost::beast::http::fields &headers,
                                   Clock::time_point now) {
  Decision decision;
  if (!enabled()) {
    decision.allowed = true;
    return decision;
  }
  auto header = headers.find(
      boost::beast::string_view(kAuthHeader.data(), kAuthHeader.size()));
  if (header != headers.end() &&
      TokensEqual(
          std::string_view(header->value().data(), header->value().size()),
          token_)) {
    decision.allowed = true;
    decision.set_cookie = fmt::format(
        "{}={}; Path=/; Max-Age={}; HttpOnly; SameSite=Strict", kSessionCookie,
        IssueSession(now), session_ttl_.count());
    return decision;
  }
  auto cookie = headers.find(boost::beast::http::field::cookie);
  if (cookie != headers.end() &&
      HasValidSession(std::string_view(cookie->value().data(),
                                       cookie->value().size()),
                      now)) {
    decision.allowed = true;
  }
  return decision;
}

std::size_t AuthGate::session_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::string AuthGate::IssueSession(Clock::time_point now) {
  auto token = RandomToken();
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    it = it->second <= now ? sessions_.erase(it) : std::next(it);
  }
  sessions_[token] = now + session_ttl_;
  return token;
}

bool AuthGate::HasValidSession(std::string_view cookie_header,
                               Clock::time_point now) {
  auto value = FindCookie(cookie_header, kSessionCookie);
  if (!value) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(*value);
  if (it == sessions_.end()) {
    return false;
  }
  if (it->second <= now) {
    sessions_.erase(it);
    return false;
  }
  return true;
}

}  // namespace qbeecli::broker
