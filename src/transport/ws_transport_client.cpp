#include "transport/ws_transport_client.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/url.hpp>

#include <fmt/format.h>
#include <openssl/err.h>

#include <algorithm>
#include <cstring>
#include <deque>
#include <unordered_map>

#include "my_error_codes.hpp"
#include "transport/mux_frame.hpp"
#include "transport/stream_messages.hpp"

#ifndef QBEE_CLI_VERSION
#define QBEE_CLI_VERSION "dev"
#endif

namespace qbeecli::transport {
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace urls = boost::urls;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr std::size_t kMaxFramePayload = 32 * 1024;

struct EdgeEndpoint {
  std::string host;
  std::string port{"443"};
  std::string target{"/"};
};

EdgeEndpoint ParseEdgeUrl(const std::string &edge_url) {
  auto parsed = urls::parse_uri(edge_url);
  if (!parsed) {
    throw std::runtime_error(fmt::format("invalid edge url '{}': {}", edge_url,
                                         parsed.error().message()));
  }
  const auto &url = parsed.value();
  if (!url.has_authority() || url.host().empty()) {
    throw std::runtime_error(fmt::format("edge url missing host: '{}'", edge_url));
  }
  const auto scheme = url.scheme();
  if (scheme != "https" && scheme != "wss") {
    throw std::runtime_error(fmt::format(
        "edge url must use https:// or wss:// (got '{}')", scheme));
  }
  EdgeEndpoint ep;
  ep.host = std::string(url.host());
  ep.port = url.has_port() ? std::string(url.port()) : std::string("443");
  std::string target = std::string(url.encoded_path());
  if (target.empty()) {
    target = "/";
  }
  if (url.has_query()) {
    target += "?";
    target += std::string(url.encoded_query());
  }
  ep.target = std::move(target);
  return ep;
}

class WsSession;

class MuxStream : public IStream, public std::enable_shared_from_this<MuxStream> {
 public:
  MuxStream(std::weak_ptr<WsSession> session, net::any_io_executor executor,
            std::uint32_t id)
      : session_(std::move(session)), executor_(std::move(executor)), id_(id) {}

  std::uint32_t id() const { return id_; }

  void async_read_some(net::mutable_buffer buffer, IoHandler handler) override {
    net::dispatch(executor_, [self = shared_from_this(), buffer,
                              handler = std::move(handler)]() mutable {
      if (self->read_handler_) {
        net::post(self->executor_, [handler = std::move(handler)]() {
          handler(net::error::in_progress, 0);
        });
        return;
      }
      self->read_buffer_ = buffer;
      self->read_handler_ = std::move(handler);
      self->TryCompleteRead();
    });
  }

  void async_write(net::const_buffer buffer, IoHandler handler) override;

  void close() override;

  // Session strand only.
  void OnData(std::string payload) {
    if (local_closed_) {
      return;
    }
    if (!payload.empty()) {
      inbound_.push_back(std::move(payload));
    }
    TryCompleteRead();
  }

  void OnRemoteClose() {
    remote_closed_ = true;
    TryCompleteRead();
  }

  void OnSessionError(boost::system::error_code ec) {
    if (!error_) {
      error_ = ec;
    }
    TryCompleteRead();
  }

 private:
  void TryCompleteRead() {
    if (!read_handler_) {
      return;
    }
    if (!inbound_.empty()) {
      auto &front = inbound_.front();
      const std::size_t n =
          std::min(read_buffer_.size(), front.size() - front_offset_);
      std::memcpy(read_buffer_.data(), front.data() + front_offset_, n);
      front_offset_ += n;
      if (front_offset_ == front.size()) {
        inbound_.pop_front();
        front_offset_ = 0;
      }
      CompleteRead({}, n);
    } else if (local_closed_) {
      CompleteRead(net::error::operation_aborted, 0);
    } else if (error_) {
      CompleteRead(error_, 0);
    } else if (remote_closed_) {
      CompleteRead(net::error::eof, 0);
    }
  }

  void CompleteRead(boost::system::error_code ec, std::size_t n) {
    auto handler = std::move(read_handler_);
    read_handler_ = nullptr;
    net::post(executor_, [handler = std::move(handler), ec, n]() { handler(ec, n); });
  }

  std::weak_ptr<WsSession> session_;
  net::any_io_executor executor_;
  std::uint32_t id_;
  std::deque<std::string> inbound_;
  std::size_t front_offset_{0};
  net::mutable_buffer read_buffer_;
  IoHandler read_handler_;
  bool remote_closed_{false};
  bool local_closed_{false};
  boost::system::error_code error_;
};

class WsSession : public ISession, public std::enable_shared_from_this<WsSession> {
 public:
  using FrameDone = std::function<void(boost::system::error_code)>;

  WsSession(net::io_context &ioc, SessionOptions options, EdgeEndpoint endpoint)
      : options_(std::move(options)), endpoint_(std::move(endpoint)),
        ssl_ctx_(ssl::context::tls_client),
        ws_(net::make_strand(ioc), ssl_ctx_), resolver_(ws_.get_executor()) {}

  net::any_io_executor executor() { return ws_.get_executor(); }

  void Start(ITransportClient::ConnectHandler handler) {
    connect_handler_ = std::move(handler);
    net::dispatch(executor(), [self = shared_from_this()]() {
      self->ConfigureSsl();
      self->Resolve();
    });
  }

  void async_open_stream(MessageType type, std::string payload,
                         OpenHandler handler) override {
    async_open_typed_stream(shared_from_this(), type, std::move(payload),
                            std::move(handler));
  }

  void async_open_plain_stream(StreamHandler handler) override {
    net::dispatch(executor(), [self = shared_from_this(),
                               handler = std::move(handler)]() mutable {
      if (self->closed_) {
        self->PostStream(std::move(handler), self->CloseReason(), nullptr);
        return;
      }
      const std::uint32_t id = self->next_stream_id_;
      self->next_stream_id_ += 2;
      auto stream = std::make_shared<MuxStream>(self, self->executor(), id);
      self->streams_.emplace(id, stream);
      self->SendFrame(EncodeMuxFrame(MuxFrame{MuxFrameKind::open, id, {}}),
                      [self, stream, handler = std::move(handler)](
                          boost::system::error_code ec) mutable {
                        if (ec) {
                          self->streams_.erase(stream->id());
                          self->PostStream(std::move(handler), ec, nullptr);
                          return;
                        }
                        self->PostStream(std::move(handler), {}, stream);
                      });
    });
  }

  void async_accept_stream(StreamHandler handler) override {
    net::dispatch(executor(), [self = shared_from_this(),
                               handler = std::move(handler)]() mutable {
      if (!self->accepted_.empty()) {
        auto stream = self->accepted_.front();
        self->accepted_.pop_front();
        self->PostStream(std::move(handler), {}, stream);
        return;
      }
      if (self->closed_) {
        self->PostStream(std::move(handler), self->CloseReason(), nullptr);
        return;
      }
      self->accept_waiters_.push_back(std::move(handler));
    });
  }

  void close() override {
    net::dispatch(executor(), [self = shared_from_this()]() {
      if (self->closing_) {
        return;
      }
      self->closing_ = true;
      self->Shutdown(net::error::operation_aborted);
      self->resolver_.cancel();
      if (self->established_ && self->ws_.is_open()) {
        self->ws_.async_close(
            websocket::close_code::normal,
            beast::bind_front_handler(&WsSession::OnClose, self));
      } else {
        beast::error_code ignored;
        beast::get_lowest_layer(self->ws_).socket().close(ignored);
      }
    });
  }

  // Strand only.
  void SendFrame(std::string frame, FrameDone done) {
    if (closed_) {
      if (done) {
        net::post(executor(), [done = std::move(done), ec = CloseReason()]() {
          done(ec);
        });
      }
      return;
    }
    write_queue_.emplace_back(std::move(frame), std::move(done));
    if (write_queue_.size() == 1) {
      DoWrite();
    }
  }

  void Forget(std::uint32_t id) { streams_.erase(id); }

  boost::system::error_code CloseReason() const {
    return close_reason_ ? close_reason_
                         : my_errors::make_error_code(
                               my_errors::TRANSPORT::SESSION_CLOSED);
  }

 private:
  void PostStream(StreamHandler handler, boost::system::error_code ec,
                  StreamPtr stream) {
    net::post(executor(), [handler = std::move(handler), ec,
                           stream = std::move(stream)]() { handler(ec, stream); });
  }

  void ConfigureSsl() {
    if (options_.relaxed_tls) {
      ws_.next_layer().set_verify_mode(ssl::verify_none);
      return;
    }
    try {
      ssl_ctx_.set_default_verify_paths();
      ws_.next_layer().set_verify_mode(ssl::verify_peer);
      ws_.next_layer().set_verify_callback(
          ssl::host_name_verification(endpoint_.host));
    } catch (const std::exception &ex) {
      BOOST_LOG_SEV(lg, trivial::warning)
          << "edge TLS verify setup failed, continuing: " << ex.what();
    }
  }

  void Resolve() {
    BOOST_LOG_SEV(lg, trivial::debug)
        << "edge resolving " << endpoint_.host << ':' << endpoint_.port;
    resolver_.async_resolve(
        endpoint_.host, endpoint_.port,
        beast::bind_front_handler(&WsSession::OnResolve, shared_from_this()));
  }

  void OnResolve(const beast::error_code &ec, tcp::resolver::results_type results) {
    if (ec) {
      FailConnect("resolve", ec);
      return;
    }
    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(ws_).async_connect(
        results,
        beast::bind_front_handler(&WsSession::OnConnect, shared_from_this()));
  }

  void OnConnect(const beast::error_code &ec,
                 const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      FailConnect("connect", ec);
      return;
    }
    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(),
                                  endpoint_.host.c_str())) {
      beast::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                  net::error::get_ssl_category()};
      FailConnect("set_sni", sni_error);
      return;
    }
    ws_.next_layer().async_handshake(
        ssl::stream_base::client,
        beast::bind_front_handler(&WsSession::OnTlsHandshake, shared_from_this()));
  }

  void OnTlsHandshake(const beast::error_code &ec) {
    if (ec) {
      FailConnect("tls_handshake", ec);
      return;
    }
    beast::get_lowest_layer(ws_).expires_never();
    websocket::stream_base::timeout opt{
        std::chrono::seconds(30),
        std::chrono::seconds(std::max(5, options_.keepalive_seconds)), true};
    ws_.set_option(opt);
    ws_.set_option(websocket::stream_base::decorator(
        [token = options_.auth_token](websocket::request_type &req) {
          req.set(http::field::user_agent,
                  std::string("qbee-cli/") + QBEE_CLI_VERSION);
          if (!token.empty()) {
            req.set(http::field::authorization, "Bearer " + token);
          }
        }));
    ws_.binary(true);
    ws_.async_handshake(
        endpoint_.host, endpoint_.target,
        beast::bind_front_handler(&WsSession::OnWsHandshake, shared_from_this()));
  }

  void OnWsHandshake(const beast::error_code &ec) {
    if (ec) {
      FailConnect("ws_handshake", ec);
      return;
    }
    established_ = true;
    BOOST_LOG_SEV(lg, trivial::info)
        << "edge session established to " << endpoint_.host << endpoint_.target;
    auto handler = std::move(connect_handler_);
    connect_handler_ = nullptr;
    net::post(executor(), [handler = std::move(handler),
                           self = shared_from_this()]() { handler({}, self); });
    StartRead();
  }

  void FailConnect(const char *context, const beast::error_code &ec) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "edge " << context << " error: " << ec.message();
    closed_ = true;
    close_reason_ = ec;
    if (connect_handler_) {
      auto handler = std::move(connect_handler_);
      connect_handler_ = nullptr;
      net::post(executor(), [handler = std::move(handler), ec]() {
        handler(ec, nullptr);
      });
    }
  }

  void StartRead() {
    ws_.async_read(read_buffer_, beast::bind_front_handler(&WsSession::OnRead,
                                                           shared_from_this()));
  }

  void OnRead(const beast::error_code &ec, std::size_t bytes_transferred) {
    if (ec) {
      if (ec == websocket::error::closed) {
        BOOST_LOG_SEV(lg, trivial::warning) << "edge session closed by peer";
        Shutdown(my_errors::make_error_code(my_errors::TRANSPORT::SESSION_CLOSED));
      } else {
        if (!closing_) {
          BOOST_LOG_SEV(lg, trivial::error) << "edge read error: " << ec.message();
        }
        Shutdown(ec);
      }
      return;
    }
    std::string bytes{beast::buffers_to_string(read_buffer_.data())};
    read_buffer_.consume(bytes_transferred);
    auto frame = DecodeMuxFrame(bytes);
    if (!frame) {
      BOOST_LOG_SEV(lg, trivial::warning) << "edge sent a malformed frame";
    } else {
      HandleFrame(std::move(*frame));
    }
    StartRead();
  }

  void HandleFrame(MuxFrame frame) {
    auto it = streams_.find(frame.stream_id);
    switch (frame.kind) {
      case MuxFrameKind::open: {
        if (it != streams_.end()) {
          BOOST_LOG_SEV(lg, trivial::warning)
              << "edge reopened live stream " << frame.stream_id;
          return;
        }
        auto stream = std::make_shared<MuxStream>(weak_from_this(), executor(),
                                                  frame.stream_id);
        streams_.emplace(frame.stream_id, stream);
        if (!accept_waiters_.empty()) {
          auto handler = std::move(accept_waiters_.front());
          accept_waiters_.pop_front();
          PostStream(std::move(handler), {}, stream);
        } else {
          accepted_.push_back(stream);
        }
        return;
      }
      case MuxFrameKind::data:
        if (it != streams_.end()) {
          it->second->OnData(std::move(frame.payload));
        }
        return;
      case MuxFrameKind::close:
        if (it != streams_.end()) {
          it->second->OnRemoteClose();
        }
        return;
    }
  }

  void DoWrite() {
    ws_.async_write(net::buffer(write_queue_.front().first),
                    beast::bind_front_handler(&WsSession::OnWrite,
                                              shared_from_this()));
  }

  void OnWrite(const beast::error_code &ec, std::size_t) {
    auto done = std::move(write_queue_.front().second);
    write_queue_.pop_front();
    if (ec) {
      if (done) {
        done(ec);
      }
      Shutdown(ec);
      return;
    }
    if (done) {
      done({});
    }
    if (!write_queue_.empty()) {
      DoWrite();
    }
  }

  void OnClose(const beast::error_code &ec) {
    if (ec && ec != net::error::operation_aborted) {
      BOOST_LOG_SEV(lg, trivial::debug) << "edge close error: " << ec.message();
    }
  }

  // Fails every stream, waiter and queued frame with the given reason.
  void Shutdown(boost::system::error_code reason) {
    if (closed_) {
      return;
    }
    closed_ = true;
    close_reason_ = reason;
    for (auto &kv : streams_) {
      kv.second->OnSessionError(reason);
    }
    streams_.clear();
    accepted_.clear();
    auto waiters = std::move(accept_waiters_);
    accept_waiters_.clear();
    for (auto &handler : waiters) {
      PostStream(std::move(handler), reason, nullptr);
    }
    // The in-flight frame (front) completes through OnWrite.
    while (write_queue_.size() > 1) {
      auto done = std::move(write_queue_.back().second);
      write_queue_.pop_back();
      if (done) {
        net::post(executor(), [done = std::move(done), reason]() { done(reason); });
      }
    }
  }

  SessionOptions options_;
  EdgeEndpoint endpoint_;
  ssl::context ssl_ctx_;
  websocket::stream<ssl::stream<beast::tcp_stream>> ws_;
  tcp::resolver resolver_;
  beast::flat_buffer read_buffer_;
  ITransportClient::ConnectHandler connect_handler_;
  std::unordered_map<std::uint32_t, std::shared_ptr<MuxStream>> streams_;
  std::deque<std::shared_ptr<MuxStream>> accepted_;
  std::deque<StreamHandler> accept_waiters_;
  std::deque<std::pair<std::string, FrameDone>> write_queue_;
  std::uint32_t next_stream_id_{1};
  bool established_{false};
  bool closing_{false};
  bool closed_{false};
  boost::system::error_code close_reason_;
  src::severity_logger<trivial::severity_level> lg;
};

void MuxStream::async_write(net::const_buffer buffer, IoHandler handler) {
  net::dispatch(executor_, [self = shared_from_this(), buffer,
                            handler = std::move(handler)]() mutable {
    auto session = self->session_.lock();
    boost::system::error_code ec;
    if (self->local_closed_) {
      ec = net::error::operation_aborted;
    } else if (self->error_) {
      ec = self->error_;
    } else if (self->remote_closed_ || !session) {
      ec = net::error::broken_pipe;
    }
    if (ec) {
      net::post(self->executor_,
                [handler = std::move(handler), ec]() { handler(ec, 0); });
      return;
    }
    const auto *data = static_cast<const char *>(buffer.data());
    const std::size_t total = buffer.size();
    if (total == 0) {
      net::post(self->executor_,
                [handler = std::move(handler)]() { handler({}, 0); });
      return;
    }
    // The handler fires once, after the last chunk was written.
    std::size_t offset = 0;
    while (offset < total) {
      const std::size_t n = std::min(kMaxFramePayload, total - offset);
      MuxFrame frame{MuxFrameKind::data, self->id_, std::string(data + offset, n)};
      offset += n;
      WsSession::FrameDone done;
      if (offset == total) {
        done = [handler = std::move(handler), total](boost::system::error_code ec) {
          handler(ec, ec ? 0 : total);
        };
      }
      session->SendFrame(EncodeMuxFrame(frame), std::move(done));
    }
  });
}

void MuxStream::close() {
  net::dispatch(executor_, [self = shared_from_this()]() {
    if (self->local_closed_) {
      return;
    }
    self->local_closed_ = true;
    self->inbound_.clear();
    self->TryCompleteRead();
    if (auto session = self->session_.lock()) {
      session->Forget(self->id_);
      if (!self->error_) {
        session->SendFrame(
            EncodeMuxFrame(MuxFrame{MuxFrameKind::close, self->id_, {}}), nullptr);
      }
    }
  });
}

} // namespace

WsTransportClient::WsTransportClient(IoContextManager &io_context_manager)
    : ioc_(io_context_manager.ioc()) {}

void WsTransportClient::async_connect(SessionOptions options,
                                      ConnectHandler handler) {
  EdgeEndpoint endpoint;
  try {
    endpoint = ParseEdgeUrl(options.url);
  } catch (const std::exception &ex) {
    BOOST_LOG_SEV(lg, trivial::error) << ex.what();
    net::post(ioc_, [handler = std::move(handler)]() {
      handler(my_errors::make_error_code(my_errors::TRANSPORT::SESSION_OPEN_FAILED),
              nullptr);
    });
    return;
  }
  BOOST_LOG_SEV(lg, trivial::debug)
      << "opening edge session to " << options.url
      << (options.relaxed_tls ? " (relaxed TLS)" : "");
  auto session = std::make_shared<WsSession>(ioc_, std::move(options),
                                             std::move(endpoint));
  session->Start(std::move(handler));
}

} // namespace qbeecli::transport
