#pragma once

#include <boost/asio/any_io_executor.hpp>

#include <functional>
#include <string>
#include <string_view>

#include "api/management_api.hpp"
#include "qbee_error.hpp"
#include "util/my_logging.hpp"

namespace qbeecli {

// Where a device's remote access sessions are terminated.
struct EdgeTarget {
  std::string device_uuid;
  std::string edge_host;
  api::EdgeVersion edge_version{api::EdgeVersion::openvpn};
  // https://<edge>/device/<uuid>
  std::string edge_url;
  bool relaxed_tls{false};
};

// 8-4-4-4-12 hexadecimal groups.
bool IsUuid(std::string_view id);

// Asks the management API whether a device is reachable and through which
// edge. Nothing is cached: every new session resolves again.
class DeviceStatusResolver {
 public:
  using ResolveHandler = std::function<void(Error, EdgeTarget)>;
  using DeviceIdHandler = std::function<void(Error, std::string)>;

  DeviceStatusResolver(boost::asio::any_io_executor executor,
                       api::IManagementApi &api)
      : executor_(std::move(executor)), api_(api) {}

  void async_resolve(const std::string &device_id, ResolveHandler handler);

  // A UUID is mapped to the device's public key digest through the
  // inventory; any other id is returned as given.
  void async_resolve_device_id(const std::string &id, DeviceIdHandler handler);

 private:
  boost::asio::any_io_executor executor_;
  api::IManagementApi &api_;
  src::severity_logger<trivial::severity_level> lg;
};

}  // namespace qbeecli
