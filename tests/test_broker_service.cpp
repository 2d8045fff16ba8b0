#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "broker/auth_gate.hpp"
#include "broker/broker_service.hpp"
#include "broker/connection_cache.hpp"
#include "broker/reverse_proxy.hpp"
#include "customio/console_output.hpp"
#include "fake_management_api.hpp"
#include "io_test_support.hpp"

namespace qbeecli::broker {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;
using namespace std::chrono_literals;

namespace {

// Tunnel source answering from a fixed table.
class TableTunnelSource : public ITunnelSource {
 public:
  explicit TableTunnelSource(net::any_io_executor executor)
      : executor_(std::move(executor)) {}

  void set(const std::string &device_id, const std::string &port,
           std::uint16_t local_port) {
    std::lock_guard<std::mutex> lock(mutex_);
    table_[CacheKey(device_id, port)] = local_port;
  }

  void acquire(std::string device_id, std::string device_port,
               PortHandler handler) override {
    Error err;
    std::uint16_t port = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(CacheKey(device_id, device_port));
      auto it = table_.find(CacheKey(device_id, device_port));
      if (it == table_.end()) {
        err = make_error(my_errors::DEVICE::LOOKUP_FAILED,
                         "error getting device status: device not found");
      } else {
        port = it->second;
      }
    }
    net::post(executor_, [handler = std::move(handler), err, port]() {
      handler(err, port);
    });
  }

  std::vector<std::string> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  net::any_io_executor executor_;
  mutable std::mutex mutex_;
  std::map<std::string, std::uint16_t> table_;
  std::vector<std::string> requests_;
};

// Plays the web server behind a tunnel: answers every request with its
// target and echoes the headers the broker is expected to rewrite.
class UpstreamServer : public std::enable_shared_from_this<UpstreamServer> {
 public:
  explicit UpstreamServer(net::io_context &ioc)
      : acceptor_(ioc, {net::ip::make_address("127.0.0.1"), 0}) {}

  std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

  void start() { Accept(); }
  void close() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
  }

 private:
  struct Conn {
    explicit Conn(tcp::socket s) : stream(std::move(s)) {}
    beast::tcp_stream stream;
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::response<http::string_body> res;
  };

  void Accept() {
    acceptor_.async_accept([self = shared_from_this()](
                               boost::system::error_code ec, tcp::socket s) {
      if (ec) {
        return;
      }
      auto conn = std::make_shared<Conn>(std::move(s));
      http::async_read(conn->stream, conn->buffer, conn->req,
                       [conn](beast::error_code ec, std::size_t) {
                         if (ec) {
                           return;
                         }
                         conn->res = {http::status::ok, 11};
                         conn->res.set("X-Seen-Host", conn->req[http::field::host]);
                         conn->res.set("X-Seen-Forwarded-For",
                                       conn->req["X-Forwarded-For"]);
                         conn->res.set("X-Seen-Device-Header",
                                       conn->req.count(kDeviceIdHeader.data())
                                           ? "yes"
                                           : "no");
                         conn->res.set(http::field::connection, "close");
                         conn->res.body() = "upstream " +
                                            std::string(conn->req.target()) +
                                            " " + conn->req.body();
                         conn->res.prepare_payload();
                         http::async_write(
                             conn->stream, conn->res,
                             [conn](beast::error_code, std::size_t) {
                               boost::system::error_code ignored;
                               conn->stream.socket().shutdown(
                                   tcp::socket::shutdown_both, ignored);
                             });
                       });
      self->Accept();
    });
  }

  tcp::acceptor acceptor_;
};

// Answers every connection with a fixed raw response, then closes it.
class RawUpstream : public std::enable_shared_from_this<RawUpstream> {
 public:
  RawUpstream(net::io_context &ioc, std::string response)
      : acceptor_(ioc, {net::ip::make_address("127.0.0.1"), 0}),
        response_(std::move(response)) {}

  std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

  void start() { Accept(); }
  void close() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
  }

 private:
  struct Conn {
    explicit Conn(tcp::socket s) : socket(std::move(s)) {}
    tcp::socket socket;
    std::string request;
  };

  void Accept() {
    acceptor_.async_accept([self = shared_from_this()](
                               boost::system::error_code ec, tcp::socket s) {
      if (ec) {
        return;
      }
      auto conn = std::make_shared<Conn>(std::move(s));
      net::async_read_until(
          conn->socket, net::dynamic_buffer(conn->request), "\r\n\r\n",
          [self, conn](boost::system::error_code ec, std::size_t) {
            if (ec) {
              return;
            }
            net::async_write(conn->socket, net::buffer(self->response_),
                             [self, conn](boost::system::error_code,
                                          std::size_t) {
                               boost::system::error_code ignored;
                               conn->socket.shutdown(
                                   tcp::socket::shutdown_both, ignored);
                             });
          });
      self->Accept();
    });
  }

  tcp::acceptor acceptor_;
  std::string response_;
};

// Accepts WebSocket upgrades and echoes every message back.
class EchoWebSocketUpstream
    : public std::enable_shared_from_this<EchoWebSocketUpstream> {
 public:
  explicit EchoWebSocketUpstream(net::io_context &ioc)
      : acceptor_(ioc, {net::ip::make_address("127.0.0.1"), 0}) {}

  std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

  void start() { Accept(); }
  void close() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
  }

  std::string upgrade_target() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return upgrade_target_;
  }

 private:
  struct Conn : std::enable_shared_from_this<Conn> {
    explicit Conn(tcp::socket s) : ws(std::move(s)) {}

    void Read() {
      ws.async_read(buffer, [self = shared_from_this()](beast::error_code ec,
                                                        std::size_t) {
        if (ec) {
          return;
        }
        self->ws.text(self->ws.got_text());
        self->ws.async_write(self->buffer.data(),
                             [self](beast::error_code ec, std::size_t) {
                               if (ec) {
                                 return;
                               }
                               self->buffer.consume(self->buffer.size());
                               self->Read();
                             });
      });
    }

    websocket::stream<beast::tcp_stream> ws;
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
  };

  void Accept() {
    acceptor_.async_accept([self = shared_from_this()](
                               boost::system::error_code ec, tcp::socket s) {
      if (ec) {
        return;
      }
      auto conn = std::make_shared<Conn>(std::move(s));
      http::async_read(
          beast::get_lowest_layer(conn->ws), conn->buffer, conn->req,
          [self, conn](beast::error_code ec, std::size_t) {
            if (ec || !websocket::is_upgrade(conn->req)) {
              return;
            }
            {
              std::lock_guard<std::mutex> lock(self->mutex_);
              self->upgrade_target_ = std::string(conn->req.target());
            }
            conn->ws.async_accept(conn->req, [conn](beast::error_code ec) {
              if (!ec) {
                conn->Read();
              }
            });
          });
      self->Accept();
    });
  }

  tcp::acceptor acceptor_;
  mutable std::mutex mutex_;
  std::string upgrade_target_;
};

http::response<http::string_body>
Send(std::uint16_t port, http::request<http::string_body> req) {
  net::io_context ioc;
  beast::tcp_stream stream(ioc);
  stream.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
  req.version(11);
  req.prepare_payload();
  http::write(stream, req);
  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res);
  boost::system::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
  return res;
}

std::string Chunk(const std::string &data) {
  std::ostringstream out;
  out << std::hex << data.size() << "\r\n" << data << "\r\n";
  return out.str();
}

http::request<http::string_body> Get(const std::string &target,
                                     const std::string &device = {}) {
  http::request<http::string_body> req{http::verb::get, target, 11};
  if (!device.empty()) {
    req.set(kDeviceIdHeader.data(), device);
  }
  return req;
}

class BrokerServiceTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (service_) {
      service_->stop();
    }
    if (done_.valid()) {
      testutil::WaitFor(done_);
    }
    if (upstream_) {
      upstream_->close();
    }
    if (raw_upstream_) {
      raw_upstream_->close();
    }
    if (ws_upstream_) {
      ws_upstream_->close();
    }
    io_.Drain();
  }

  void start(const std::string &token = {},
             std::chrono::seconds reauth = std::chrono::seconds(0),
             std::uint16_t listen_port = 0) {
    auth_ = std::make_unique<AuthGate>(token, std::chrono::seconds(3600));
    BrokerService::Options options;
    options.listen_address = "127.0.0.1";
    options.listen_port = listen_port;
    options.reauth_interval = reauth;
    service_ = std::make_shared<BrokerService>(io_.executor(), api_, cache_,
                                               *auth_, tunnels_, proxy_,
                                               output_, options);
    auto promise = std::make_shared<std::promise<Error>>();
    done_ = promise->get_future();
    service_->start([promise](Error err) { promise->set_value(std::move(err)); });
  }

  std::uint16_t wait_listening() {
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (service_->port() == 0 &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(5ms);
    }
    return service_->port();
  }

  std::uint16_t start_upstream() {
    upstream_ = std::make_shared<UpstreamServer>(io_.ioc());
    upstream_->start();
    return upstream_->port();
  }

  std::uint16_t start_raw_upstream(std::string response) {
    raw_upstream_ = std::make_shared<RawUpstream>(io_.ioc(), std::move(response));
    raw_upstream_->start();
    return raw_upstream_->port();
  }

  std::uint16_t start_ws_upstream() {
    ws_upstream_ = std::make_shared<EchoWebSocketUpstream>(io_.ioc());
    ws_upstream_->start();
    return ws_upstream_->port();
  }

  testutil::IoThread io_;
  std::ostringstream console_;
  customio::ConsoleOutput output_{customio::ConsoleOutput::kInfo, console_};
  testutil::FakeManagementApi api_{io_.executor()};
  ConnectionCache cache_{std::chrono::seconds(300)};
  TableTunnelSource tunnels_{io_.executor()};
  ReverseProxy proxy_{ReverseProxy::Options{}};
  std::unique_ptr<AuthGate> auth_;
  std::shared_ptr<UpstreamServer> upstream_;
  std::shared_ptr<RawUpstream> raw_upstream_;
  std::shared_ptr<EchoWebSocketUpstream> ws_upstream_;
  std::shared_ptr<BrokerService> service_;
  std::future<Error> done_;
};

} // namespace

TEST(RouteRequestTest, HeaderWinsOverHost) {
  http::fields headers;
  headers.set(http::field::host, "other.broker.local:8081");
  headers.set("X-Qbee-Device-Id", "dev1");
  headers.set("X-Qbee-Device-Port", "8443");
  auto route = RouteRequest(headers, "80");
  EXPECT_EQ(route.device_id, "dev1");
  EXPECT_EQ(route.device_port, "8443");
}

TEST(RouteRequestTest, FirstHostLabelAndDefaultPort) {
  http::fields headers;
  headers.set(http::field::host, "abc123.broker.local:8081");
  EXPECT_EQ(RouteRequest(headers, "80").device_id, "abc123");
  EXPECT_EQ(RouteRequest(headers, "80").device_port, "80");

  headers.set(http::field::host, "abc123:8081");
  EXPECT_EQ(RouteRequest(headers, "80").device_id, "abc123");

  http::fields empty;
  EXPECT_TRUE(RouteRequest(empty, "80").device_id.empty());
}

TEST(ReverseProxyHeadersTest, StripsHopByHopAndConnectionTokens) {
  ProxyRequest req{http::verb::get, "/", 11};
  req.set(http::field::connection, "keep-alive, X-Private");
  req.set("X-Private", "1");
  req.set(http::field::keep_alive, "timeout=5");
  req.set(http::field::upgrade, "websocket");
  req.set("Proxy-Connection", "keep-alive");
  req.set(http::field::te, "trailers");
  req.set(http::field::accept, "text/html");

  StripHopByHopHeaders(req);
  EXPECT_EQ(req.count(http::field::connection), 0u);
  EXPECT_EQ(req.count("X-Private"), 0u);
  EXPECT_EQ(req.count(http::field::keep_alive), 0u);
  EXPECT_EQ(req.count(http::field::upgrade), 0u);
  EXPECT_EQ(req.count("Proxy-Connection"), 0u);
  EXPECT_EQ(req.count(http::field::te), 0u);
  EXPECT_EQ(req[http::field::accept], "text/html");
}

TEST(ReverseProxyHeadersTest, UpstreamRequestRewritesHostAndForwardedFor) {
  ProxyRequest req{http::verb::post, "/api", 11};
  req.set(http::field::host, "dev1.broker.local");
  req.set("X-Forwarded-For", "10.0.0.1");
  req.body() = "{}";

  auto upstream = MakeUpstreamRequest(req, 40123, "192.168.1.5");
  EXPECT_EQ(upstream[http::field::host], "localhost:40123");
  EXPECT_EQ(upstream["X-Forwarded-For"], "10.0.0.1, 192.168.1.5");
  EXPECT_FALSE(upstream.keep_alive());
  EXPECT_EQ(upstream.body(), "{}");
  EXPECT_EQ(upstream[http::field::content_length], "2");

  ProxyRequest bare{http::verb::get, "/", 11};
  EXPECT_EQ(MakeUpstreamRequest(bare, 1, "127.0.0.1")["X-Forwarded-For"],
            "127.0.0.1");
}

TEST(ReverseProxyHeadersTest, UpgradeRequestKeepsUpgradeHeaders) {
  ProxyRequest req{http::verb::get, "/live", 11};
  req.set(http::field::connection, "keep-alive, Upgrade");
  req.set(http::field::upgrade, "websocket");
  req.set(http::field::sec_websocket_key, "dGhlIHNhbXBsZSBub25jZQ==");
  EXPECT_TRUE(IsUpgradeRequest(req));

  auto upstream = MakeUpstreamRequest(req, 40123, "127.0.0.1");
  EXPECT_EQ(upstream[http::field::connection], "upgrade");
  EXPECT_EQ(upstream[http::field::upgrade], "websocket");
  EXPECT_EQ(upstream[http::field::sec_websocket_key],
            "dGhlIHNhbXBsZSBub25jZQ==");

  ProxyRequest plain{http::verb::get, "/", 11};
  plain.set(http::field::upgrade, "websocket");
  EXPECT_FALSE(IsUpgradeRequest(plain));
  EXPECT_EQ(MakeUpstreamRequest(plain, 1, "").count(http::field::upgrade), 0u);
}

TEST_F(BrokerServiceTest, ProxiesToTheDeviceTunnel) {
  tunnels_.set("dev1", "80", start_upstream());
  start();
  const auto port = wait_listening();
  ASSERT_NE(port, 0);

  auto req = Get("/status?x=1", "dev1");
  req.method(http::verb::post);
  req.body() = "payload";
  auto res = Send(port, req);
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res.body(), "upstream /status?x=1 payload");
  EXPECT_EQ(res["X-Seen-Host"].substr(0, 10), "localhost:");
  EXPECT_EQ(res["X-Seen-Forwarded-For"], "127.0.0.1");
  EXPECT_EQ(res["X-Seen-Device-Header"], "no");
  EXPECT_EQ(tunnels_.requests(), std::vector<std::string>{"dev1:80"});
}

TEST_F(BrokerServiceTest, ChunkedUpstreamBodyIsRelayedOnKeptAliveConnection) {
  const std::string big(40000, 'x');
  tunnels_.set("dev1", "80",
               start_raw_upstream("HTTP/1.1 200 OK\r\n"
                                  "Content-Type: text/plain\r\n"
                                  "Transfer-Encoding: chunked\r\n\r\n" +
                                  Chunk("hello ") + Chunk(big) +
                                  Chunk(" end") + "0\r\n\r\n"));
  start();
  const auto port = wait_listening();

  net::io_context cio;
  beast::tcp_stream stream(cio);
  stream.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
  beast::flat_buffer buffer;
  for (int i = 0; i < 2; ++i) {
    SCOPED_TRACE(i);
    http::write(stream, Get("/stream", "dev1"));
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_TRUE(res.chunked());
    EXPECT_TRUE(res.keep_alive());
    EXPECT_EQ(res[http::field::content_type], "text/plain");
    EXPECT_EQ(res.body(), "hello " + big + " end");
  }
  EXPECT_EQ(tunnels_.requests().size(), 2u);
}

TEST_F(BrokerServiceTest, BodyEndingAtUpstreamCloseIsRelayed) {
  tunnels_.set("dev1", "80",
               start_raw_upstream("HTTP/1.1 200 OK\r\nConnection: close\r\n"
                                  "\r\nstreamed until close"));
  start();
  const auto port = wait_listening();

  // An HTTP/1.1 client gets the body chunked.
  auto res = Send(port, Get("/", "dev1"));
  EXPECT_TRUE(res.chunked());
  EXPECT_EQ(res.body(), "streamed until close");

  // An HTTP/1.0 client gets it up to the close.
  net::io_context cio;
  beast::tcp_stream stream(cio);
  stream.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
  auto req = Get("/", "dev1");
  req.version(10);
  http::write(stream, req);
  beast::flat_buffer buffer;
  http::response<http::string_body> old;
  http::read(stream, buffer, old);
  EXPECT_EQ(old.result(), http::status::ok);
  EXPECT_FALSE(old.chunked());
  EXPECT_FALSE(old.keep_alive());
  EXPECT_EQ(old.body(), "streamed until close");
}

TEST_F(BrokerServiceTest, WebSocketUpgradeIsSplicedToTheDevice) {
  tunnels_.set("dev1", "80", start_ws_upstream());
  start("s3cret");
  const auto port = wait_listening();

  net::io_context cio;
  websocket::stream<beast::tcp_stream> ws(cio);
  beast::get_lowest_layer(ws).connect(
      tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
  ws.set_option(websocket::stream_base::decorator(
      [](websocket::request_type &req) {
        req.set(kDeviceIdHeader.data(), "dev1");
        req.set(kAuthHeader.data(), "s3cret");
      }));
  websocket::response_type upgrade;
  ws.handshake(upgrade, "dev1.broker.local", "/live");
  EXPECT_EQ(upgrade.result(), http::status::switching_protocols);
  EXPECT_FALSE(upgrade[http::field::set_cookie].empty());
  EXPECT_EQ(ws_upstream_->upgrade_target(), "/live");

  for (const auto &msg :
       std::vector<std::string>{"first frame", std::string(50000, 'w')}) {
    ws.write(net::buffer(msg));
    beast::flat_buffer buffer;
    ws.read(buffer);
    EXPECT_EQ(beast::buffers_to_string(buffer.data()), msg);
  }
  ws.close(websocket::close_code::normal);
}

TEST_F(BrokerServiceTest, DevicePortHeaderSelectsTunnel) {
  tunnels_.set("dev1", "8080", start_upstream());
  start();
  const auto port = wait_listening();
  auto req = Get("/", "dev1");
  req.set(kDevicePortHeader.data(), "8080");
  EXPECT_EQ(Send(port, req).result(), http::status::ok);
}

TEST_F(BrokerServiceTest, MissingDeviceIsBadRequest) {
  start();
  auto res = Send(wait_listening(), Get("/"));
  EXPECT_EQ(res.result(), http::status::bad_request);
  EXPECT_EQ(res.body(), "no device ID provided\n");
  EXPECT_EQ(res[http::field::content_type], "text/plain; charset=utf-8");
}

TEST_F(BrokerServiceTest, TunnelFailureIsNotFound) {
  start();
  auto res = Send(wait_listening(), Get("/", "unknown"));
  EXPECT_EQ(res.result(), http::status::not_found);
  EXPECT_EQ(res.body(), "error getting device status: device not found\n");
}

TEST_F(BrokerServiceTest, DeadUpstreamIsBadGateway) {
  tunnels_.set("dev1", "80", testutil::FreeTcpPort());
  start();
  auto res = Send(wait_listening(), Get("/", "dev1"));
  EXPECT_EQ(res.result(), http::status::bad_gateway);
  EXPECT_EQ(res.body().rfind("proxy ", 0), 0u);
}

TEST_F(BrokerServiceTest, TokenRequiredWhenConfigured) {
  tunnels_.set("dev1", "80", start_upstream());
  start("s3cret");
  const auto port = wait_listening();

  auto denied = Send(port, Get("/", "dev1"));
  EXPECT_EQ(denied.result(), http::status::unauthorized);
  EXPECT_EQ(denied.body(), "Unauthorized\n");
  EXPECT_TRUE(tunnels_.requests().empty());

  auto with_token = Get("/", "dev1");
  with_token.set(kAuthHeader.data(), "s3cret");
  auto allowed = Send(port, with_token);
  EXPECT_EQ(allowed.result(), http::status::ok);
  auto cookie = std::string(allowed[http::field::set_cookie]);
  ASSERT_FALSE(cookie.empty());

  auto with_cookie = Get("/", "dev1");
  with_cookie.set(http::field::cookie, cookie.substr(0, cookie.find(';')));
  auto again = Send(port, with_cookie);
  EXPECT_EQ(again.result(), http::status::ok);
  EXPECT_TRUE(again[http::field::set_cookie].empty());
}

TEST_F(BrokerServiceTest, OpenBrokerWarns) {
  start();
  wait_listening();
  io_.Drain();
  auto text = console_.str();
  EXPECT_NE(text.find("Warning: No authentication token provided. Device "
                      "access will be open"),
            std::string::npos);
  EXPECT_NE(text.find("Broker listening on 127.0.0.1:"), std::string::npos);
}

TEST_F(BrokerServiceTest, StopCompletesCleanlyAndClearsCache) {
  auto cancelled = std::make_shared<std::atomic<int>>(0);
  TunnelHandle handle;
  handle.local_port = 1;
  handle.id = 1;
  handle.cancel = [cancelled]() { ++*cancelled; };
  cache_.add("dev1:80", handle);

  start();
  ASSERT_NE(wait_listening(), 0);
  service_->stop();
  auto err = testutil::WaitFor(done_);
  ASSERT_TRUE(err.has_value());
  EXPECT_FALSE(*err);
  EXPECT_EQ(cache_.size(), 0u);
  EXPECT_EQ(*cancelled, 1);
}

TEST_F(BrokerServiceTest, OccupiedPortFailsStart) {
  net::io_context other;
  tcp::acceptor taken(other, {net::ip::make_address("127.0.0.1"), 0});
  start({}, std::chrono::seconds(0), taken.local_endpoint().port());
  auto err = testutil::WaitFor(done_);
  ASSERT_TRUE(err.has_value());
  EXPECT_TRUE(err->is(my_errors::TUNNEL::BIND_FAILED));
  EXPECT_EQ(err->what.rfind("error starting broker: listen tcp 127.0.0.1:", 0),
            0u);
}

TEST_F(BrokerServiceTest, FailedReauthenticationStopsTheBroker) {
  api_.fail_authentication(
      make_error(my_errors::AUTH::LOGIN_FAILED, "invalid credentials"));
  start({}, std::chrono::seconds(1));
  auto err = testutil::WaitFor(done_, 5000ms);
  ASSERT_TRUE(err.has_value());
  EXPECT_TRUE(err->is(my_errors::AUTH::LOGIN_FAILED));
  EXPECT_EQ(err->what, "error re-authenticating: invalid credentials");
  EXPECT_EQ(api_.authenticate_calls(), 1);
}

TEST_F(BrokerServiceTest, SuccessfulReauthenticationKeepsRunning) {
  start({}, std::chrono::seconds(1));
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (api_.authenticate_calls() < 2 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(20ms);
  }
  EXPECT_GE(api_.authenticate_calls(), 2);
  EXPECT_EQ(done_.wait_for(0ms), std::future_status::timeout);
}

} // namespace qbeecli::broker
