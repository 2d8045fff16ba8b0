#include "broker/reverse_proxy.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>

#include <fmt/format.h>

#include <array>
#include <limits>
#include <memory>
#include <optional>
#include <vector>

#include "my_error_codes.hpp"
#include "transport/local_stream.hpp"
#include "tunnel/splice.hpp"

namespace qbeecli::broker {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

using UpstreamStream = beast::ssl_stream<beast::tcp_stream>;

constexpr std::size_t kRelayBufferSize = 16 * 1024;

constexpr std::array<http::field, 8> kHopByHop = {
    http::field::connection,         http::field::keep_alive,
    http::field::proxy_authenticate, http::field::proxy_authorization,
    http::field::te,                 http::field::trailer,
    http::field::transfer_encoding,  http::field::upgrade,
};

std::vector<std::string> ConnectionTokens(beast::string_view value) {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : value) {
    if (c == ',') {
      if (!current.empty()) {
        tokens.push_back(current);
      }
      current.clear();
    } else if (c != ' ' && c != '\t') {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

// Upgraded TLS upstream seen as a plain byte stream.
class TlsStream : public transport::IStream,
                  public std::enable_shared_from_this<TlsStream> {
 public:
  TlsStream(std::shared_ptr<ssl::context> ctx,
            std::shared_ptr<UpstreamStream> stream)
      : ctx_(std::move(ctx)), stream_(std::move(stream)) {}

  void async_read_some(net::mutable_buffer buffer,
                       IoHandler handler) override {
    stream_->async_read_some(buffer, std::move(handler));
  }

  void async_write(net::const_buffer buffer, IoHandler handler) override {
    net::async_write(*stream_, buffer, std::move(handler));
  }

  void close() override {
    net::post(stream_->get_executor(), [self = shared_from_this()]() {
      auto &lowest = beast::get_lowest_layer(*self->stream_);
      beast::error_code ignored;
      lowest.socket().shutdown(tcp::socket::shutdown_both, ignored);
      lowest.close();
    });
  }

 private:
  std::shared_ptr<ssl::context> ctx_;
  std::shared_ptr<UpstreamStream> stream_;
};

}  // namespace

template <bool isRequest, typename Body>
void StripHopByHopHeaders(http::message<isRequest, Body> &msg) {
  auto connection = msg.find(http::field::connection);
  if (connection != msg.end()) {
    for (const auto &name : ConnectionTokens(connection->value())) {
      msg.erase(beast::string_view(name.data(), name.size()));
    }
  }
  for (auto field : kHopByHop) {
    msg.erase(field);
  }
  msg.erase("Proxy-Connection");
}

template void StripHopByHopHeaders(ProxyRequest &);
template void StripHopByHopHeaders(ProxyResponse &);
template void StripHopByHopHeaders(ProxyResponseHead &);

bool IsUpgradeRequest(const ProxyRequest &req) {
  auto upgrade = req.find(http::field::upgrade);
  auto connection = req.find(http::field::connection);
  if (upgrade == req.end() || upgrade->value().empty() ||
      connection == req.end()) {
    return false;
  }
  for (const auto &token : ConnectionTokens(connection->value())) {
    if (beast::iequals(token, "upgrade")) {
      return true;
    }
  }
  return false;
}

ProxyRequest MakeUpstreamRequest(ProxyRequest req, std::uint16_t local_port,
                                 const std::string &client_address) {
  const bool upgrade = IsUpgradeRequest(req);
  const std::string protocol(req[http::field::upgrade]);
  StripHopByHopHeaders(req);
  req.set(http::field::host, fmt::format("localhost:{}", local_port));
  if (!client_address.empty()) {
    auto prior = req.find("X-Forwarded-For");
    if (prior != req.end()) {
      req.set("X-Forwarded-For",
              fmt::format("{}, {}",
                          std::string_view(prior->value().data(),
                                           prior->value().size()),
                          client_address));
    } else {
      req.set("X-Forwarded-For", client_address);
    }
  }
  if (upgrade) {
    req.set(http::field::connection, "upgrade");
    req.set(http::field::upgrade, protocol);
  } else {
    req.keep_alive(false);
  }
  req.prepare_payload();
  return req;
}

class ReverseProxy::Call : public std::enable_shared_from_this<ReverseProxy::Call> {
 public:
  Call(Options options, std::uint16_t port, ProxyRequest req, Client client,
       Handler handler)
      : options_(options), port_(port), client_version_(req.version()),
        client_keep_alive_(req.keep_alive()),
        head_request_(req.method() == http::verb::head),
        upgrade_requested_(IsUpgradeRequest(req)),
        request_(MakeUpstreamRequest(std::move(req), port, client.address)),
        client_(std::move(client)), handler_(std::move(handler)),
        ssl_ctx_(std::make_shared<ssl::context>(ssl::context::tls_client)),
        stream_(std::make_shared<UpstreamStream>(client_.stream->get_executor(),
                                                 *ssl_ctx_)) {
    parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());
    parser_.skip(head_request_);
  }

  void Start() {
    stream_->set_verify_mode(ssl::verify_none);
    beast::get_lowest_layer(*stream_).expires_after(options_.connect_timeout);
    beast::get_lowest_layer(*stream_).async_connect(
        tcp::endpoint(net::ip::address_v4::loopback(), port_),
        beast::bind_front_handler(&Call::OnConnect, shared_from_this()));
  }

 private:
  void OnConnect(const beast::error_code &ec) {
    if (ec) {
      Fail("connect", ec);
      return;
    }
    if (!options_.tls) {
      Write(beast::get_lowest_layer(*stream_));
      return;
    }
    stream_->async_handshake(
        ssl::stream_base::client,
        beast::bind_front_handler(&Call::OnHandshake, shared_from_this()));
  }

  void OnHandshake(const beast::error_code &ec) {
    if (ec) {
      Fail("tls handshake", ec);
      return;
    }
    Write(*stream_);
  }

  template <typename Stream> void Write(Stream &stream) {
    beast::get_lowest_layer(*stream_).expires_after(options_.idle_timeout);
    http::async_write(stream, request_,
                      [self = shared_from_this(), &stream](
                          const beast::error_code &ec, std::size_t) {
                        if (ec) {
                          self->Fail("write", ec);
                          return;
                        }
                        self->ReadHeader(stream);
                      });
  }

  template <typename Stream> void ReadHeader(Stream &stream) {
    beast::get_lowest_layer(*stream_).expires_after(options_.idle_timeout);
    http::async_read_header(stream, buffer_, parser_,
                            [self = shared_from_this(), &stream](
                                const beast::error_code &ec, std::size_t) {
                              if (ec) {
                                self->Fail("read", ec);
                                return;
                              }
                              self->WriteHead(stream);
                            });
  }

  // Sends the response header on, choosing how the body is framed for the
  // client.
  template <typename Stream> void WriteHead(Stream &stream) {
    const auto &upstream = parser_.get();
    upgrading_ = upgrade_requested_ &&
                 upstream.result() == http::status::switching_protocols;
    const std::string protocol(upstream[http::field::upgrade]);
    head_ = ProxyResponseHead(upstream.base());
    StripHopByHopHeaders(head_);
    head_.version(client_version_);
    if (upgrading_) {
      head_.set(http::field::connection, "upgrade");
      head_.set(http::field::upgrade, protocol);
    } else if (parser_.is_done() || parser_.content_length()) {
      head_.keep_alive(client_keep_alive_);
    } else if (client_version_ >= 11) {
      head_.chunked(true);
      chunked_ = true;
      head_.keep_alive(client_keep_alive_);
    } else {
      // An HTTP/1.0 client learns where the body ends from the close.
      head_.keep_alive(false);
    }
    if (client_.set_cookie) {
      head_.set(http::field::set_cookie, *client_.set_cookie);
    }
    serializer_.emplace(head_);
    client_.stream->expires_after(options_.idle_timeout);
    http::async_write_header(
        *client_.stream, *serializer_,
        [self = shared_from_this(), &stream](const beast::error_code &ec,
                                             std::size_t) {
          if (ec) {
            self->Fail("client write", ec);
            return;
          }
          self->sent_ = true;
          if (self->upgrading_) {
            self->Upgrade();
            return;
          }
          if (self->parser_.is_done()) {
            self->Done();
            return;
          }
          self->ReadBody(stream);
        });
  }

  template <typename Stream> void ReadBody(Stream &stream) {
    auto &body = parser_.get().body();
    body.data = relay_buffer_.data();
    body.size = relay_buffer_.size();
    beast::get_lowest_layer(*stream_).expires_after(options_.idle_timeout);
    http::async_read_some(
        stream, buffer_, parser_,
        [self = shared_from_this(), &stream](beast::error_code ec,
                                             std::size_t) {
          if (ec == http::error::need_buffer) {
            ec = {};
          }
          if (ec) {
            self->Fail("read", ec);
            return;
          }
          const std::size_t got =
              self->relay_buffer_.size() - self->parser_.get().body().size;
          if (got == 0) {
            if (self->parser_.is_done()) {
              self->EndBody();
            } else {
              self->ReadBody(stream);
            }
            return;
          }
          self->WriteBody(stream, got);
        });
  }

  template <typename Stream> void WriteBody(Stream &stream, std::size_t n) {
    auto next = [self = shared_from_this(), &stream](
                    const beast::error_code &ec, std::size_t) {
      if (ec) {
        self->Fail("client write", ec);
        return;
      }
      if (self->parser_.is_done()) {
        self->EndBody();
        return;
      }
      self->ReadBody(stream);
    };
    client_.stream->expires_after(options_.idle_timeout);
    const auto data = net::buffer(relay_buffer_.data(), n);
    if (chunked_) {
      net::async_write(*client_.stream, http::make_chunk(data),
                       std::move(next));
    } else {
      net::async_write(*client_.stream, data, std::move(next));
    }
  }

  void EndBody() {
    if (!chunked_) {
      Done();
      return;
    }
    client_.stream->expires_after(options_.idle_timeout);
    net::async_write(*client_.stream, http::make_chunk_last(),
                     [self = shared_from_this()](const beast::error_code &ec,
                                                 std::size_t) {
                       if (ec) {
                         self->Fail("client write", ec);
                         return;
                       }
                       self->Done();
                     });
  }

  // Hands both connections to a splice once the bytes already read on
  // either side have been passed across.
  void Upgrade() {
    auto &lowest = beast::get_lowest_layer(*stream_);
    lowest.expires_never();
    client_.stream->expires_never();
    if (options_.tls) {
      upstream_end_ = std::make_shared<TlsStream>(ssl_ctx_, stream_);
    } else {
      upstream_end_ =
          std::make_shared<transport::SocketStream>(lowest.release_socket());
    }
    client_end_ = std::make_shared<transport::SocketStream>(
        client_.stream->release_socket());
    upstream_early_ = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    BOOST_LOG_SEV(lg, trivial::debug)
        << "upgraded connection from " << client_.address << " to port "
        << port_;
    PassEarlyBytes();
  }

  void PassEarlyBytes() {
    auto self = shared_from_this();
    if (!upstream_early_.empty()) {
      client_end_->async_write(
          net::buffer(upstream_early_),
          [self](boost::system::error_code ec, std::size_t) {
            self->upstream_early_.clear();
            if (ec) {
              self->FailUpgrade(ec);
              return;
            }
            self->PassEarlyBytes();
          });
      return;
    }
    if (!client_.pending.empty()) {
      upstream_end_->async_write(
          net::buffer(client_.pending),
          [self](boost::system::error_code ec, std::size_t) {
            self->client_.pending.clear();
            if (ec) {
              self->FailUpgrade(ec);
              return;
            }
            self->PassEarlyBytes();
          });
      return;
    }
    Splice::Start(client_end_, upstream_end_,
                  [port = port_](boost::system::error_code ec) {
                    if (ec && ec != net::error::operation_aborted) {
                      src::severity_logger<trivial::severity_level> lg;
                      BOOST_LOG_SEV(lg, trivial::debug)
                          << "upgraded connection to port " << port
                          << " ended: " << ec.message();
                    }
                  });
    auto handler = std::move(handler_);
    handler(Error{}, Outcome::upgraded);
  }

  void FailUpgrade(const boost::system::error_code &ec) {
    client_end_->close();
    upstream_end_->close();
    auto handler = std::move(handler_);
    handler(make_error(my_errors::NETWORK::CONNECT_ERROR,
                       fmt::format("proxy upgrade failed: {}", ec.message())),
            Outcome::upgraded);
  }

  void Done() {
    CloseUpstream();
    auto handler = std::move(handler_);
    handler(Error{}, head_.keep_alive() ? Outcome::reusable
                                        : Outcome::finished);
  }

  void Fail(const char *what, const beast::error_code &ec) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "proxy to port " << port_ << ' ' << what << ": " << ec.message();
    CloseUpstream();
    auto handler = std::move(handler_);
    handler(make_error(my_errors::NETWORK::CONNECT_ERROR,
                       fmt::format("proxy {} failed: {}", what, ec.message())),
            sent_ ? Outcome::finished : Outcome::not_sent);
  }

  void CloseUpstream() {
    auto &lowest = beast::get_lowest_layer(*stream_);
    beast::error_code ignored;
    lowest.socket().shutdown(tcp::socket::shutdown_both, ignored);
    lowest.close();
  }

  Options options_;
  std::uint16_t port_;
  unsigned client_version_;
  bool client_keep_alive_;
  bool head_request_;
  bool upgrade_requested_;
  ProxyRequest request_;
  Client client_;
  Handler handler_;
  std::shared_ptr<ssl::context> ssl_ctx_;
  std::shared_ptr<UpstreamStream> stream_;
  beast::flat_buffer buffer_;
  http::response_parser<http::buffer_body> parser_;
  ProxyResponseHead head_;
  std::optional<http::response_serializer<http::empty_body>> serializer_;
  std::array<char, kRelayBufferSize> relay_buffer_{};
  bool chunked_{false};
  bool upgrading_{false};
  bool sent_{false};
  transport::StreamPtr client_end_;
  transport::StreamPtr upstream_end_;
  std::string upstream_early_;
  src::severity_logger<trivial::severity_level> lg;
};

void ReverseProxy::forward(std::uint16_t local_port, ProxyRequest req,
                           Client client, Handler handler) {
  std::make_shared<Call>(options_, local_port, std::move(req),
                         std::move(client), std::move(handler))
      ->Start();
}

}  // namespace qbeecli::broker
