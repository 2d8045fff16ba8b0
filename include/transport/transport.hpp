#pragma once

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace qbeecli::transport {

// Type of the first message written on a stream. ok and error are the
// peer's answers to a typed open.
enum class MessageType : std::uint8_t {
  ok = 0,
  error = 1,
  tcp_tunnel = 2,
  udp_tunnel = 3,
  pty = 4,
  pty_command = 5,
};

const char *to_string(MessageType type);

// One duplex byte channel inside a session. Handlers are always invoked
// through the session's executor, never from inside the initiating call.
class IStream {
 public:
  using IoHandler =
      std::function<void(boost::system::error_code, std::size_t)>;

  virtual ~IStream() = default;

  // Completes with at least one byte, or with asio::error::eof once the
  // peer closed its side and all buffered data was consumed.
  virtual void async_read_some(boost::asio::mutable_buffer buffer,
                               IoHandler handler) = 0;
  // Completes once the whole buffer was handed to the session.
  virtual void async_write(boost::asio::const_buffer buffer,
                           IoHandler handler) = 0;
  // Idempotent. Pending operations complete with operation_aborted.
  virtual void close() = 0;
};

using StreamPtr = std::shared_ptr<IStream>;

// One authenticated, multiplexed connection to an edge gateway.
class ISession {
 public:
  using StreamHandler =
      std::function<void(boost::system::error_code, StreamPtr)>;
  using OpenHandler = std::function<void(boost::system::error_code, StreamPtr,
                                         std::string reply)>;

  virtual ~ISession() = default;

  // Opens a stream, sends a typed initial message and waits for the peer's
  // OK. The reply carries whatever the peer attached to the OK (the PTY
  // session id for pty streams).
  virtual void async_open_stream(MessageType type, std::string payload,
                                 OpenHandler handler) = 0;
  virtual void async_open_plain_stream(StreamHandler handler) = 0;
  // Completes when the peer opens a stream, or with the error that ended
  // the session.
  virtual void async_accept_stream(StreamHandler handler) = 0;
  virtual void close() = 0;
};

using SessionPtr = std::shared_ptr<ISession>;

struct SessionOptions {
  // https://<edge>/device/<uuid>
  std::string url;
  std::string auth_token;
  // Skip certificate verification, for local and test edges.
  bool relaxed_tls{false};
  int keepalive_seconds{25};
};

class ITransportClient {
 public:
  using ConnectHandler =
      std::function<void(boost::system::error_code, SessionPtr)>;

  virtual ~ITransportClient() = default;
  virtual void async_connect(SessionOptions options,
                             ConnectHandler handler) = 0;
};

}  // namespace qbeecli::transport
