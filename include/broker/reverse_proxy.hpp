#pragma once

#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "qbee_error.hpp"
#include "util/my_logging.hpp"

namespace qbeecli::broker {

using ProxyRequest =
    boost::beast::http::request<boost::beast::http::string_body>;
using ProxyResponse =
    boost::beast::http::response<boost::beast::http::string_body>;
using ProxyResponseHead =
    boost::beast::http::response<boost::beast::http::empty_body>;

// Drops the hop-by-hop headers, including those named in Connection.
template <bool isRequest, typename Body>
void StripHopByHopHeaders(boost::beast::http::message<isRequest, Body> &msg);

// Connection carries the "upgrade" token and Upgrade names a protocol.
bool IsUpgradeRequest(const ProxyRequest &req);

// The request as it is sent to the tunnel: Host becomes localhost:<port>
// and the client address is appended to X-Forwarded-For. An upgrade request
// keeps its Connection and Upgrade headers; any other closes the upstream
// connection after the response.
ProxyRequest MakeUpstreamRequest(ProxyRequest req, std::uint16_t local_port,
                                 const std::string &client_address);

// Forwards requests to a local tunnel port and relays the response back to
// the client as it arrives. A 101 answer to an upgrade request turns both
// connections into a byte splice.
class ReverseProxy {
 public:
  enum class Outcome {
    // Nothing reached the client; the caller still has to answer.
    not_sent,
    // The response went out and the client may send another request.
    reusable,
    // The response went out, or broke off, and the client must be closed.
    finished,
    // The client socket now belongs to a splice with the upstream.
    upgraded,
  };
  using Handler = std::function<void(Error, Outcome)>;

  // The connection the response is relayed to. The stream stays owned by the
  // caller and must outlive the call, except after an upgrade, which
  // releases its socket.
  struct Client {
    boost::beast::tcp_stream *stream{nullptr};
    std::string address;
    // Bytes read past the request, handed to the upstream after an upgrade.
    std::string pending;
    std::optional<std::string> set_cookie;
  };

  struct Options {
    // https upstreams are spoken over TLS without certificate checks: the
    // device's certificate never matches localhost.
    bool tls{false};
    std::chrono::seconds connect_timeout{30};
    // Longest quiet period on either side while a response is relayed.
    std::chrono::seconds idle_timeout{60};
  };

  explicit ReverseProxy(Options options) : options_(options) {}

  void forward(std::uint16_t local_port, ProxyRequest req, Client client,
               Handler handler);

 private:
  class Call;

  Options options_;
};

}  // namespace qbeecli::broker
