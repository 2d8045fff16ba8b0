#pragma once

#include <boost/asio/io_context.hpp>

#include "transport/transport.hpp"
#include "util/io_context_manager.hpp"
#include "util/my_logging.hpp"

namespace qbeecli::transport {

// Session client over a TLS WebSocket to the edge. Streams are carried by
// a small multiplexer (see mux_frame.hpp); the bearer token travels on the
// upgrade request.
class WsTransportClient : public ITransportClient {
 public:
  explicit WsTransportClient(IoContextManager &io_context_manager);

  void async_connect(SessionOptions options, ConnectHandler handler) override;

 private:
  boost::asio::io_context &ioc_;
  src::severity_logger<trivial::severity_level> lg;
};

}  // namespace qbeecli::transport
