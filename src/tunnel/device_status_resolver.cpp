#include "tunnel/device_status_resolver.hpp"

#include <boost/asio/post.hpp>

#include <fmt/format.h>

#include <cctype>

#include "my_error_codes.hpp"

namespace qbeecli {

namespace {

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

}  // namespace

bool IsUuid(std::string_view id) {
  if (id.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < id.size(); ++i) {
    const bool dash_pos = i == 8 || i == 13 || i == 18 || i == 23;
    if (dash_pos) {
      if (id[i] != '-') {
        return false;
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
      return false;
    }
  }
  return true;
}

void DeviceStatusResolver::async_resolve(const std::string &device_id,
                                         ResolveHandler handler) {
  api_.async_get_device_status(
      device_id, [this, device_id, handler = std::move(handler)](
                     Error err, api::DeviceStatus status) {
        if (err) {
          BOOST_LOG_SEV(lg, trivial::warning)
              << "device status lookup failed for " << device_id << ": "
              << err.what;
          handler(make_error(my_errors::DEVICE::LOOKUP_FAILED,
                             fmt::format("error getting device status: {}",
                                         err.what)),
                  {});
          return;
        }
        if (!status.remote_access) {
          handler(make_error(my_errors::DEVICE::REMOTE_ACCESS_UNAVAILABLE,
                             fmt::format("remote access is not available for "
                                         "device {}",
                                         device_id)),
                  {});
          return;
        }
        EdgeTarget target;
        target.device_uuid = status.uuid;
        target.edge_host = status.edge;
        target.edge_version = status.edge_version;
        target.edge_url =
            fmt::format("https://{}/device/{}", status.edge, status.uuid);
        target.relaxed_tls = StartsWith(status.edge, "edge:") ||
                             StartsWith(status.edge, "localhost:");
        BOOST_LOG_SEV(lg, trivial::debug)
            << "device " << device_id << " served by " << target.edge_url;
        handler(Error{}, std::move(target));
      });
}

void DeviceStatusResolver::async_resolve_device_id(const std::string &id,
                                                   DeviceIdHandler handler) {
  if (!IsUuid(id)) {
    boost::asio::post(executor_, [id, handler = std::move(handler)]() {
      handler(Error{}, id);
    });
    return;
  }
  api_.async_find_devices_by_uuid(
      id, [id, handler = std::move(handler)](Error err,
                                             std::vector<std::string> digests) {
        if (err) {
          handler(make_error(my_errors::DEVICE::LOOKUP_FAILED,
                             fmt::format("error looking up device {}: {}", id,
                                         err.what)),
                  {});
          return;
        }
        if (digests.empty()) {
          handler(make_error(my_errors::DEVICE::NOT_FOUND,
                             "device not found"),
                  {});
          return;
        }
        if (digests.size() > 1) {
          handler(make_error(my_errors::DEVICE::AMBIGUOUS,
                             "multiple devices found"),
                  {});
          return;
        }
        handler(Error{}, std::move(digests.front()));
      });
}

}  // namespace qbeecli
