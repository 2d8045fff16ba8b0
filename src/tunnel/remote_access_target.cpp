#include "tunnel/remote_access_target.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace qbeecli {
namespace json = boost::json;

namespace {

std::vector<std::string_view> Split(std::string_view value, char sep) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const auto pos = value.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(value.substr(start));
      return parts;
    }
    parts.push_back(value.substr(start, pos - start));
    start = pos + 1;
  }
}

// Decimal 0-65535; anything else (sign, spaces, hex, overflow) is rejected.
bool IsPortNumber(std::string_view value) {
  if (value.empty()) {
    return false;
  }
  std::uint16_t port = 0;
  const auto *first = value.data();
  const auto *last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(first, last, port, 10);
  return ec == std::errc{} && ptr == last;
}

void CheckLocalPort(std::string_view port) {
  if (port.empty()) {
    throw TargetParseError(my_errors::TARGET::INVALID_LOCAL_PORT,
                           "invalid local port: empty port");
  }
  if (port == kStdioPort) {
    return;
  }
  if (!IsPortNumber(port)) {
    throw TargetParseError(
        my_errors::TARGET::INVALID_LOCAL_PORT,
        fmt::format("invalid local port: invalid port number '{}'", port));
  }
}

void CheckRemotePort(std::string_view port) {
  if (port.empty()) {
    throw TargetParseError(my_errors::TARGET::INVALID_REMOTE_PORT,
                           "invalid remote port: empty port");
  }
  if (!IsPortNumber(port)) {
    throw TargetParseError(
        my_errors::TARGET::INVALID_REMOTE_PORT,
        fmt::format("invalid remote port: invalid port number '{}'", port));
  }
}

} // namespace

const char *to_string(Protocol p) {
  return p == Protocol::udp ? "udp" : "tcp";
}

std::string RemoteAccessTarget::ToString() const {
  std::string out =
      fmt::format("{}:{}:{}:{}", local_host, local_port, remote_host, remote_port);
  if (protocol == Protocol::udp) {
    out += "/udp";
  }
  return out;
}

RemoteAccessTarget ParseRemoteAccessTarget(std::string_view target) {
  auto parts = Split(target, ':');
  if (parts.size() != 3 && parts.size() != 4) {
    throw TargetParseError(my_errors::TARGET::INVALID_FORMAT, "invalid format");
  }

  RemoteAccessTarget out;
  std::size_t i = 0;
  if (parts.size() == 4) {
    out.local_host = std::string(parts[i++]);
  }
  const std::string_view local_port = parts[i++];
  const std::string_view remote_host = parts[i++];
  std::string_view remote_port = parts[i];

  CheckLocalPort(local_port);

  constexpr std::string_view kUdpSuffix = "/udp";
  if (remote_port.size() >= kUdpSuffix.size() &&
      remote_port.substr(remote_port.size() - kUdpSuffix.size()) == kUdpSuffix) {
    out.protocol = Protocol::udp;
    remote_port.remove_suffix(kUdpSuffix.size());
  }
  CheckRemotePort(remote_port);

  out.local_port = std::string(local_port);
  out.remote_host = std::string(remote_host);
  out.remote_port = std::string(remote_port);
  return out;
}

std::vector<RemoteAccessTarget>
ParseTargetList(const std::vector<std::string> &targets) {
  if (targets.empty()) {
    throw TargetParseError(my_errors::TARGET::NO_TARGETS,
                           "no targets defined for device");
  }
  std::vector<RemoteAccessTarget> parsed;
  parsed.reserve(targets.size());
  for (const auto &t : targets) {
    try {
      parsed.push_back(ParseRemoteAccessTarget(t));
    } catch (const TargetParseError &ex) {
      throw TargetParseError(ex.code().value(),
                             fmt::format("error parsing target {}: {}", t,
                                         ex.message()));
    }
  }
  const bool has_stdio =
      std::any_of(parsed.begin(), parsed.end(),
                  [](const RemoteAccessTarget &t) { return t.is_stdio(); });
  if (has_stdio && parsed.size() > 1) {
    throw TargetParseError(
        my_errors::TARGET::STDIO_NOT_EXCLUSIVE,
        "stdio is only supported for single target connections");
  }
  return parsed;
}

std::vector<std::string> SplitTargets(std::string_view value) {
  std::vector<std::string> out;
  for (auto item : Split(value, ',')) {
    while (!item.empty() && item.front() == ' ') {
      item.remove_prefix(1);
    }
    while (!item.empty() && item.back() == ' ') {
      item.remove_suffix(1);
    }
    if (!item.empty()) {
      out.emplace_back(item);
    }
  }
  return out;
}

bool IsValidDeviceID(std::string_view device_id) {
  if (device_id.size() != 64) {
    return false;
  }
  return std::all_of(device_id.begin(), device_id.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
}

void ValidateDeviceID(std::string_view device_id) {
  if (!IsValidDeviceID(device_id)) {
    throw TargetParseError(my_errors::TARGET::INVALID_DEVICE_ID,
                           fmt::format("invalid device id '{}'", device_id));
  }
}

DeviceConnection tag_invoke(const json::value_to_tag<DeviceConnection> &,
                            const json::value &jv) {
  if (!jv.is_object()) {
    throw std::runtime_error("DeviceConnection must be an object");
  }
  const auto &obj = jv.as_object();
  DeviceConnection conn;
  if (auto *p = obj.if_contains("device_id"); p && p->is_string()) {
    conn.device_id = std::string(p->as_string().c_str());
  } else {
    throw std::runtime_error(
        "DeviceConnection missing string field 'device_id'");
  }
  if (auto *p = obj.if_contains("targets"); p && p->is_array()) {
    for (const auto &item : p->as_array()) {
      if (!item.is_string()) {
        throw std::runtime_error(fmt::format(
            "DeviceConnection '{}' has a non-string target", conn.device_id));
      }
      conn.targets.emplace_back(item.as_string().c_str());
    }
  } else {
    throw std::runtime_error("DeviceConnection missing array field 'targets'");
  }
  return conn;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const DeviceConnection &conn) {
  json::array targets;
  for (const auto &t : conn.targets) {
    targets.emplace_back(t);
  }
  jv = json::object{{"device_id", conn.device_id},
                    {"targets", std::move(targets)}};
}

std::vector<DeviceConnection>
LoadDeviceConnections(const std::filesystem::path &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw std::runtime_error(
        fmt::format("error reading config file {}", path.string()));
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  boost::system::error_code ec;
  auto jv = json::parse(content, ec);
  if (ec) {
    throw std::runtime_error(fmt::format("error parsing config file {}: {}",
                                         path.string(), ec.message()));
  }
  if (!jv.is_array()) {
    throw std::runtime_error(fmt::format(
        "config file {} must contain a JSON array", path.string()));
  }
  auto connections = json::value_to<std::vector<DeviceConnection>>(jv);
  if (connections.empty()) {
    throw std::runtime_error(
        fmt::format("no devices defined in config file {}", path.string()));
  }
  return connections;
}

} // namespace qbeecli
