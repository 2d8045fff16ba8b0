#pragma once

#include <boost/json.hpp>

#include <string>
#include <vector>

namespace qbeecli::api {

enum class EdgeVersion : int {
  openvpn = 0,  // legacy VPN-index tunnelling
  native = 1,
};

// GET /api/v2/device/<id>/status
struct DeviceStatus {
  std::string uuid;
  bool remote_access{false};
  std::string edge;
  EdgeVersion edge_version{EdgeVersion::openvpn};
};

DeviceStatus tag_invoke(const boost::json::value_to_tag<DeviceStatus> &,
                        const boost::json::value &jv);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const DeviceStatus &status);

struct LoginRequest {
  std::string email;
  std::string password;
};

void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const LoginRequest &req);

// Returns the token of a login response. Throws std::runtime_error when the
// response carries a two-factor challenge or no token.
std::string ParseLoginToken(const boost::json::value &jv);

// Public key digests of the items of an inventory search response.
std::vector<std::string> ParseInventoryDigests(const boost::json::value &jv);

// Query string for an inventory search by device UUID (search={"uuid":..}).
std::string InventoryUuidQuery(const std::string &uuid);

// Best-effort text for an API error body ({"error": ...}, {"message": ...}
// or the raw body).
std::string ApiErrorText(const std::string &body);

}  // namespace qbeecli::api
