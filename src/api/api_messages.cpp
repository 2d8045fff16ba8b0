#include "api/api_messages.hpp"

#include <boost/url.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace qbeecli::api {
namespace json = boost::json;
namespace urls = boost::urls;

namespace {

const json::object &RequireObject(const json::value &jv, const char *ctx) {
  if (!jv.is_object()) {
    throw std::runtime_error(fmt::format("{} must be an object", ctx));
  }
  return jv.as_object();
}

std::string OptionalString(const json::object &obj, const char *key) {
  if (auto *p = obj.if_contains(key); p && p->is_string()) {
    return std::string(p->as_string().c_str());
  }
  return {};
}

} // namespace

DeviceStatus tag_invoke(const json::value_to_tag<DeviceStatus> &,
                        const json::value &jv) {
  const auto &obj = RequireObject(jv, "DeviceStatus");
  DeviceStatus status;
  status.uuid = OptionalString(obj, "uuid");
  status.edge = OptionalString(obj, "edge");
  if (auto *p = obj.if_contains("remote_access"); p && p->is_bool()) {
    status.remote_access = p->as_bool();
  }
  if (auto *p = obj.if_contains("edge_version"); p && p->is_number()) {
    status.edge_version = p->to_number<int>() == 1 ? EdgeVersion::native
                                                   : EdgeVersion::openvpn;
  }
  return status;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const DeviceStatus &status) {
  jv = json::object{{"uuid", status.uuid},
                    {"remote_access", status.remote_access},
                    {"edge", status.edge},
                    {"edge_version", static_cast<int>(status.edge_version)}};
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const LoginRequest &req) {
  jv = json::object{{"email", req.email}, {"password", req.password}};
}

std::string ParseLoginToken(const json::value &jv) {
  const auto &obj = RequireObject(jv, "LoginResponse");
  if (obj.if_contains("challenge")) {
    throw std::runtime_error(
        "two-factor authentication required; configure an access token instead");
  }
  auto token = OptionalString(obj, "token");
  if (token.empty()) {
    throw std::runtime_error("login response missing token");
  }
  return token;
}

std::vector<std::string> ParseInventoryDigests(const json::value &jv) {
  const auto &obj = RequireObject(jv, "InventoryListResponse");
  std::vector<std::string> digests;
  auto *items = obj.if_contains("items");
  if (!items || !items->is_array()) {
    return digests;
  }
  for (const auto &item : items->as_array()) {
    if (!item.is_object()) {
      continue;
    }
    digests.push_back(OptionalString(item.as_object(), "pub_key_digest"));
  }
  return digests;
}

std::string InventoryUuidQuery(const std::string &uuid) {
  urls::url u("/api/v2/inventory");
  u.params().set("search", json::serialize(json::object{{"uuid", uuid}}));
  return std::string(u.encoded_target());
}

std::string ApiErrorText(const std::string &body) {
  boost::system::error_code ec;
  auto jv = json::parse(body, ec);
  if (!ec && jv.is_object()) {
    const auto &obj = jv.as_object();
    for (const char *key : {"error", "message"}) {
      if (auto *p = obj.if_contains(key); p && p->is_string()) {
        return std::string(p->as_string().c_str());
      }
    }
  }
  return body;
}

} // namespace qbeecli::api
