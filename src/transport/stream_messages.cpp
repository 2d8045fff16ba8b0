#include "transport/stream_messages.hpp"

#include <boost/asio/error.hpp>

#include <memory>

#include "my_error_codes.hpp"

namespace qbeecli::transport {
namespace net = boost::asio;

namespace {

struct ReadExactlyOp : std::enable_shared_from_this<ReadExactlyOp> {
  StreamPtr stream;
  std::string data;
  std::size_t filled{0};
  ReadExactlyHandler done;

  void run() {
    if (filled == data.size()) {
      done({}, std::move(data));
      return;
    }
    auto self = shared_from_this();
    stream->async_read_some(
        net::buffer(&data[filled], data.size() - filled),
        [self](boost::system::error_code ec, std::size_t n) {
          self->filled += n;
          if (ec) {
            self->done(ec, {});
            return;
          }
          self->run();
        });
  }
};

bool IsKnownType(std::uint8_t raw) {
  return raw <= static_cast<std::uint8_t>(MessageType::pty_command);
}

} // namespace

void async_read_exactly(
    StreamPtr stream, std::size_t size,
    ReadExactlyHandler done) {
  auto op = std::make_shared<ReadExactlyOp>();
  op->stream = std::move(stream);
  op->data.resize(size);
  op->done = std::move(done);
  op->run();
}

const char *to_string(MessageType type) {
  switch (type) {
    case MessageType::ok:
      return "ok";
    case MessageType::error:
      return "error";
    case MessageType::tcp_tunnel:
      return "tcp_tunnel";
    case MessageType::udp_tunnel:
      return "udp_tunnel";
    case MessageType::pty:
      return "pty";
    case MessageType::pty_command:
      return "pty_command";
  }
  return "unknown";
}

std::string EncodeMessage(MessageType type, const std::string &payload) {
  std::string out;
  out.reserve(kMessageHeaderSize + payload.size());
  const auto len = static_cast<std::uint32_t>(payload.size());
  out.push_back(static_cast<char>(type));
  out.push_back(static_cast<char>((len >> 24) & 0xff));
  out.push_back(static_cast<char>((len >> 16) & 0xff));
  out.push_back(static_cast<char>((len >> 8) & 0xff));
  out.push_back(static_cast<char>(len & 0xff));
  out += payload;
  return out;
}

void async_write_message(StreamPtr stream, MessageType type,
                         std::string payload, WriteMessageHandler handler) {
  if (payload.size() > kMaxMessagePayload) {
    handler(my_errors::make_error_code(my_errors::GENERAL::INVALID_ARGUMENT));
    return;
  }
  auto frame = std::make_shared<std::string>(EncodeMessage(type, payload));
  auto *raw = stream.get();
  raw->async_write(net::buffer(*frame),
                   [frame, stream = std::move(stream),
                    handler = std::move(handler)](
                       boost::system::error_code ec, std::size_t) {
                     handler(ec);
                   });
}

void async_read_message(StreamPtr stream, ReadMessageHandler handler) {
  async_read_exactly(
      stream, kMessageHeaderSize,
      [stream, handler = std::move(handler)](boost::system::error_code ec,
                                             std::string header) mutable {
        if (ec) {
          handler(ec, MessageType::error, {});
          return;
        }
        const auto raw_type = static_cast<std::uint8_t>(header[0]);
        const std::uint32_t len =
            (static_cast<std::uint32_t>(static_cast<std::uint8_t>(header[1])) << 24) |
            (static_cast<std::uint32_t>(static_cast<std::uint8_t>(header[2])) << 16) |
            (static_cast<std::uint32_t>(static_cast<std::uint8_t>(header[3])) << 8) |
            static_cast<std::uint32_t>(static_cast<std::uint8_t>(header[4]));
        if (!IsKnownType(raw_type) || len > kMaxMessagePayload) {
          handler(my_errors::make_error_code(my_errors::TRANSPORT::PROTOCOL_ERROR),
                  MessageType::error, {});
          return;
        }
        const auto type = static_cast<MessageType>(raw_type);
        async_read_exactly(
            std::move(stream), len,
            [type, handler = std::move(handler)](boost::system::error_code ec,
                                                 std::string payload) {
              handler(ec, type, std::move(payload));
            });
      });
}

void async_expect_ok(StreamPtr stream, ExpectOkHandler handler) {
  async_read_message(
      std::move(stream),
      [handler = std::move(handler)](boost::system::error_code ec,
                                     MessageType type, std::string payload) {
        if (ec) {
          handler(ec, {});
          return;
        }
        if (type == MessageType::ok) {
          handler({}, std::move(payload));
        } else if (type == MessageType::error) {
          handler(my_errors::make_error_code(my_errors::TRANSPORT::REJECTED),
                  std::move(payload));
        } else {
          handler(my_errors::make_error_code(my_errors::TRANSPORT::PROTOCOL_ERROR),
                  std::string("expected ok, got ") + to_string(type));
        }
      });
}

void async_open_typed_stream(const SessionPtr &session, MessageType type,
                             std::string payload,
                             ISession::OpenHandler handler) {
  session->async_open_plain_stream(
      [type, payload = std::move(payload), handler = std::move(handler)](
          boost::system::error_code ec, StreamPtr stream) mutable {
        if (ec) {
          handler(ec, nullptr, {});
          return;
        }
        async_write_message(
            stream, type, std::move(payload),
            [stream, handler = std::move(handler)](
                boost::system::error_code ec) mutable {
              if (ec) {
                stream->close();
                handler(ec, nullptr, {});
                return;
              }
              async_expect_ok(
                  stream, [stream, handler = std::move(handler)](
                              boost::system::error_code ec, std::string reply) {
                    if (ec) {
                      stream->close();
                      handler(ec, nullptr, std::move(reply));
                      return;
                    }
                    handler({}, stream, std::move(reply));
                  });
            });
      });
}

} // namespace qbeecli::transport
