#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "qbee_error.hpp"

namespace qbeecli {

enum class Protocol { tcp, udp };

inline constexpr std::string_view kStdioPort = "stdio";
inline constexpr std::string_view kDefaultLocalHost = "localhost";

// One forwarding request: [<localHost>:]<localPort>:<remoteHost>:<remotePort>[/udp]
struct RemoteAccessTarget {
  Protocol protocol{Protocol::tcp};
  std::string local_host{kDefaultLocalHost};
  std::string local_port;
  std::string remote_host;
  std::string remote_port;

  bool is_stdio() const { return local_port == kStdioPort; }
  // "remoteHost:remotePort", the address a tunnel stream is opened to.
  std::string remote_address() const { return remote_host + ":" + remote_port; }
  std::string local_address() const { return local_host + ":" + local_port; }
  // Canonical four-field form.
  std::string ToString() const;

  friend bool operator==(const RemoteAccessTarget &,
                         const RemoteAccessTarget &) = default;
};

const char *to_string(Protocol p);

// Throws TargetParseError with TARGET::INVALID_FORMAT, INVALID_LOCAL_PORT or
// INVALID_REMOTE_PORT. Purely syntactic, no name resolution.
RemoteAccessTarget ParseRemoteAccessTarget(std::string_view target);

// Parses every target of one device. Throws TARGET::NO_TARGETS for an empty
// list and TARGET::STDIO_NOT_EXCLUSIVE when stdio is not the only target.
std::vector<RemoteAccessTarget>
ParseTargetList(const std::vector<std::string> &targets);

// Splits a comma-separated --target value, dropping empty items.
std::vector<std::string> SplitTargets(std::string_view value);

// Exactly 64 characters of [0-9a-f].
bool IsValidDeviceID(std::string_view device_id);

// Throws TargetParseError(TARGET::INVALID_DEVICE_ID) when the id is invalid.
void ValidateDeviceID(std::string_view device_id);

// A raw, not yet parsed request for one device.
struct DeviceConnection {
  std::string device_id;
  std::vector<std::string> targets;

  friend DeviceConnection tag_invoke(
      const boost::json::value_to_tag<DeviceConnection> &,
      const boost::json::value &jv);
  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const DeviceConnection &conn);
};

// Reads a JSON array of {"device_id", "targets"} objects. Throws
// std::runtime_error on I/O or shape problems, or an empty array.
std::vector<DeviceConnection>
LoadDeviceConnections(const std::filesystem::path &path);

}  // namespace qbeecli
