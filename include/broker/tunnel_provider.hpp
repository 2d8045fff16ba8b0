#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "broker/connection_cache.hpp"
#include "qbee_error.hpp"
#include "tunnel/device_connector.hpp"
#include "tunnel/device_status_resolver.hpp"
#include "util/my_logging.hpp"

namespace qbeecli::broker {

// Finds a free TCP port on 127.0.0.1. Throws boost::system::system_error.
std::uint16_t PickFreePort();

// Source of local ports that reach <device>:<port>.
class ITunnelSource {
 public:
  using PortHandler = std::function<void(Error, std::uint16_t)>;

  virtual ~ITunnelSource() = default;
  virtual void acquire(std::string device_id, std::string device_port,
                       PortHandler handler) = 0;
};

// Hands out local ports that tunnel to <device>:<port>, reusing cached
// tunnels. A new tunnel counts once its local port accepts connections; the
// connector failing first, or the port staying closed past the timeout,
// fails the request. Concurrent requests for one key share a single attempt.
class TunnelProvider : public ITunnelSource,
                       public std::enable_shared_from_this<TunnelProvider> {
 public:
  struct Options {
    std::string remote_host{"localhost"};
    std::chrono::milliseconds port_ready_timeout{15000};
    std::chrono::milliseconds poll_interval{50};
  };

  TunnelProvider(boost::asio::any_io_executor executor, ConnectionCache &cache,
                 DeviceStatusResolver &resolver,
                 IConnectorFactory &connector_factory, Options options);

  void acquire(std::string device_id, std::string device_port,
               PortHandler handler) override;

 private:
  struct Attempt;

  void Establish(const std::string &key, const std::string &device_id,
                 const std::string &device_port);
  void Poll(std::shared_ptr<Attempt> attempt);
  void Settle(const std::shared_ptr<Attempt> &attempt, Error err);

  boost::asio::strand<boost::asio::any_io_executor> strand_;
  ConnectionCache &cache_;
  DeviceStatusResolver &resolver_;
  IConnectorFactory &connector_factory_;
  Options options_;
  std::map<std::string, std::vector<PortHandler>> waiting_;
  std::uint64_t next_tunnel_id_{1};
  src::severity_logger<trivial::severity_level> lg;
};

}  // namespace qbeecli::broker
