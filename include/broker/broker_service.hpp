#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/http/fields.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "api/management_api.hpp"
#include "broker/auth_gate.hpp"
#include "broker/connection_cache.hpp"
#include "broker/reverse_proxy.hpp"
#include "broker/tunnel_provider.hpp"
#include "customio/console_output.hpp"
#include "qbee_error.hpp"
#include "util/my_logging.hpp"

namespace qbeecli::broker {

inline constexpr std::string_view kDeviceIdHeader = "X-Qbee-Device-Id";
inline constexpr std::string_view kDevicePortHeader = "X-Qbee-Device-Port";

struct Route {
  std::string device_id;
  std::string device_port;
};

// The device comes from X-Qbee-Device-Id, else the first label of Host; the
// port from X-Qbee-Device-Port, else the default.
Route RouteRequest(const boost::beast::http::fields &headers,
                   const std::string &default_port);

// HTTP front of the broker. Each request passes the auth gate, is routed to
// a device port, gets a local tunnel and is proxied through it. Per-request
// failures are answered and never stop the service; a failed periodic
// re-authentication does.
class BrokerService : public std::enable_shared_from_this<BrokerService> {
 public:
  struct Options {
    std::string listen_address{"0.0.0.0"};
    std::uint16_t listen_port{8081};
    std::string remote_port{"80"};
    std::chrono::seconds gc_interval{60};
    // Zero disables re-authentication.
    std::chrono::seconds reauth_interval{600};
    std::uint64_t request_body_limit{16 * 1024 * 1024};
  };

  BrokerService(boost::asio::any_io_executor executor,
                api::IManagementApi &api, ConnectionCache &cache,
                AuthGate &auth, ITunnelSource &tunnels, ReverseProxy &proxy,
                customio::ConsoleOutput &output, Options options);

  // Binds the listener, then runs until stop() or a fatal error.
  void start(Completion handler);
  void stop();

  std::uint16_t port() const { return port_.load(); }

 private:
  class Session;

  void DoAccept();
  void ScheduleReauth();
  void Finish(Error err);

  boost::asio::any_io_executor executor_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  api::IManagementApi &api_;
  ConnectionCache &cache_;
  AuthGate &auth_;
  ITunnelSource &tunnels_;
  ReverseProxy &proxy_;
  customio::ConsoleOutput &output_;
  Options options_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::steady_timer reauth_timer_;
  std::atomic<std::uint16_t> port_{0};
  Completion handler_;
  bool finished_{false};
  src::severity_logger<trivial::severity_level> lg;
};

}  // namespace qbeecli::broker
