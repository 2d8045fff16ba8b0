#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "customio/console_output.hpp"
#include "qbee_error.hpp"
#include "transport/transport.hpp"
#include "tunnel/remote_access_target.hpp"
#include "tunnel/splice.hpp"
#include "tunnel/udp_relay.hpp"
#include "util/my_logging.hpp"

namespace qbeecli {

// Bridges local endpoints to streams of one open session.
//
// A single stdio target pipes the process stdin and stdout through one
// tcp_tunnel stream and completes when either direction ends. Otherwise every
// TCP target gets a listener (one stream per accepted connection) and every
// UDP target a socket (one stream per local peer). The bridge then runs until
// the session fails, completing with TRANSPORT::SESSION_CLOSED, or until
// stop(), completing cleanly. Everything it opened is closed on completion.
class TunnelBridge : public std::enable_shared_from_this<TunnelBridge> {
 public:
  TunnelBridge(boost::asio::any_io_executor executor,
               transport::SessionPtr session, std::string device_id,
               customio::ConsoleOutput &output);

  void start(std::vector<RemoteAccessTarget> targets, Completion handler);
  void stop();

  // Replaces the process stdin/stdout pair used by a stdio target.
  void set_stdio_stream(transport::StreamPtr stream) {
    stdio_stream_ = std::move(stream);
  }

  // How long a UDP flow may stay quiet before its stream is closed.
  void set_udp_idle_timeout(std::chrono::steady_clock::duration timeout) {
    udp_idle_timeout_ = timeout;
  }

 private:
  using Strand = boost::asio::strand<boost::asio::any_io_executor>;

  void DoStart(std::vector<RemoteAccessTarget> targets);
  void StartStdio(const RemoteAccessTarget &target);
  Error ListenTcp(const RemoteAccessTarget &target);
  Error ListenUdp(const RemoteAccessTarget &target);
  void Accept(std::shared_ptr<boost::asio::ip::tcp::acceptor> acceptor,
              RemoteAccessTarget target);
  void RetryAccept(std::shared_ptr<boost::asio::ip::tcp::acceptor> acceptor,
                   RemoteAccessTarget target);
  void OnAccepted(boost::asio::ip::tcp::socket socket,
                  const RemoteAccessTarget &target);
  void TrackSplice(std::shared_ptr<transport::IStream> local,
                   transport::StreamPtr remote);
  void WatchSession();
  void Finish(Error err);

  Strand strand_;
  transport::SessionPtr session_;
  std::string device_id_;
  customio::ConsoleOutput &output_;
  Completion handler_;
  transport::StreamPtr stdio_stream_;
  std::chrono::steady_clock::duration udp_idle_timeout_{
      UdpRelay::kDefaultIdleTimeout};
  std::vector<std::shared_ptr<boost::asio::ip::tcp::acceptor>> acceptors_;
  std::set<std::shared_ptr<boost::asio::steady_timer>> retry_timers_;
  std::vector<std::shared_ptr<UdpRelay>> udp_relays_;
  std::map<std::uint64_t, std::shared_ptr<Splice>> splices_;
  std::uint64_t next_splice_id_{0};
  bool started_{false};
  bool finished_{false};
  src::severity_logger<trivial::severity_level> lg;
};

}  // namespace qbeecli
