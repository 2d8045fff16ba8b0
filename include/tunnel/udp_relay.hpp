#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>

#include "transport/transport.hpp"
#include "util/my_logging.hpp"

namespace qbeecli {

// Datagrams travel over a stream as a 2 byte big-endian length followed by
// the payload.
inline constexpr std::size_t kMaxDatagramSize = 65535;

std::string EncodeDatagram(const std::string &payload);

// One bound UDP socket relayed to a remote address. Every local peer is a
// flow with its own udp_tunnel stream; replies on that stream go back to
// the peer they belong to. A flow with no datagram in either direction for
// the idle timeout is closed; the peer's next datagram opens a new one.
class UdpRelay : public std::enable_shared_from_this<UdpRelay> {
 public:
  using Strand = boost::asio::strand<boost::asio::any_io_executor>;

  static constexpr std::chrono::steady_clock::duration kDefaultIdleTimeout =
      std::chrono::minutes(2);

  UdpRelay(Strand strand, boost::asio::ip::udp::socket socket,
           transport::SessionPtr session, std::string remote_address,
           std::chrono::steady_clock::duration idle_timeout =
               kDefaultIdleTimeout);

  void start();
  // Closes the socket and every flow stream.
  void close();

  boost::asio::ip::udp::endpoint local_endpoint() const;

 private:
  static constexpr std::size_t kMaxPendingDatagrams = 256;

  struct Flow {
    explicit Flow(const Strand &strand) : idle(strand) {}

    transport::StreamPtr stream;
    std::deque<std::string> pending;
    bool writing{false};
    boost::asio::steady_timer idle;
    std::chrono::steady_clock::time_point last_activity;
  };
  using FlowPtr = std::shared_ptr<Flow>;

  void Receive();
  void HandleDatagram(const boost::asio::ip::udp::endpoint &peer,
                      std::string payload);
  void OpenFlow(const boost::asio::ip::udp::endpoint &peer, FlowPtr flow);
  void WriteNext(const boost::asio::ip::udp::endpoint &peer, FlowPtr flow);
  void ReadReply(const boost::asio::ip::udp::endpoint &peer, FlowPtr flow);
  void WatchIdle(const boost::asio::ip::udp::endpoint &peer, FlowPtr flow);
  void DropFlow(const boost::asio::ip::udp::endpoint &peer,
                const FlowPtr &flow);

  Strand strand_;
  boost::asio::ip::udp::socket socket_;
  transport::SessionPtr session_;
  std::string remote_address_;
  std::chrono::steady_clock::duration idle_timeout_;
  std::array<char, kMaxDatagramSize> receive_buffer_{};
  boost::asio::ip::udp::endpoint sender_;
  std::map<boost::asio::ip::udp::endpoint, FlowPtr> flows_;
  bool closed_{false};
  src::severity_logger<trivial::severity_level> lg;
};

}  // namespace qbeecli
