#include "broker/broker_service.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <fmt/format.h>

#include <optional>

#include "my_error_codes.hpp"
#include "util/post_to.hpp"

namespace qbeecli::broker {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

std::string HeaderValue(const http::fields &headers, std::string_view name) {
  auto it = headers.find(beast::string_view(name.data(), name.size()));
  if (it == headers.end()) {
    return {};
  }
  return std::string(it->value().data(), it->value().size());
}

ProxyResponse TextResponse(http::status status, const std::string &text) {
  ProxyResponse res{status, 11};
  res.set(http::field::content_type, "text/plain; charset=utf-8");
  res.body() = text + "\n";
  return res;
}

}  // namespace

Route RouteRequest(const http::fields &headers,
                   const std::string &default_port) {
  Route route;
  route.device_id = HeaderValue(headers, kDeviceIdHeader);
  if (route.device_id.empty()) {
    auto host = HeaderValue(headers, "Host");
    route.device_id = host.substr(0, host.find_first_of(".:"));
  }
  route.device_port = HeaderValue(headers, kDevicePortHeader);
  if (route.device_port.empty()) {
    route.device_port = default_port;
  }
  return route;
}

class BrokerService::Session : public std::enable_shared_from_this<Session> {
 public:
  Session(tcp::socket socket, std::shared_ptr<BrokerService> service)
      : stream_(std::move(socket)), service_(std::move(service)) {
    boost::system::error_code ec;
    auto remote = stream_.socket().remote_endpoint(ec);
    if (!ec) {
      client_address_ = remote.address().to_string();
    }
  }

  void Run() { DoRead(); }

 private:
  void DoRead() {
    parser_.emplace();
    parser_->body_limit(service_->options_.request_body_limit);
    stream_.expires_after(std::chrono::seconds(60));
    http::async_read(
        stream_, buffer_, *parser_,
        beast::bind_front_handler(&Session::OnRead, shared_from_this()));
  }

  void OnRead(const beast::error_code &ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      Close();
      return;
    }
    if (ec) {
      if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
        BOOST_LOG_SEV(lg, trivial::debug)
            << "broker read from " << client_address_ << ": " << ec.message();
      }
      Close();
      return;
    }
    // Tunnel setup and the upstream call bound their own time.
    stream_.expires_never();
    Handle(parser_->release());
  }

  void Handle(ProxyRequest req) {
    auto &svc = *service_;
    version_ = req.version();
    keep_alive_ = req.keep_alive();
    head_ = req.method() == http::verb::head;

    auto decision = svc.auth_.check(req.base());
    if (!decision.allowed) {
      BOOST_LOG_SEV(lg, trivial::info)
          << "rejected unauthorized request from " << client_address_;
      Respond(TextResponse(http::status::unauthorized, "Unauthorized"));
      return;
    }
    cookie_ = std::move(decision.set_cookie);

    auto route = RouteRequest(req.base(), svc.options_.remote_port);
    if (route.device_id.empty()) {
      Respond(TextResponse(http::status::bad_request, "no device ID provided"));
      return;
    }
    // Broker headers are not forwarded to the device.
    req.erase(beast::string_view(kAuthHeader.data(), kAuthHeader.size()));
    req.erase(beast::string_view(kDeviceIdHeader.data(), kDeviceIdHeader.size()));
    req.erase(
        beast::string_view(kDevicePortHeader.data(), kDevicePortHeader.size()));

    BOOST_LOG_SEV(lg, trivial::debug)
        << req.method_string() << ' ' << req.target() << " -> "
        << route.device_id << ':' << route.device_port;

    svc.tunnels_.acquire(
        route.device_id, route.device_port,
        PostTo(stream_.get_executor(),
               [self = shared_from_this(), req = std::move(req),
                route](Error err, std::uint16_t local_port) {
                 if (err) {
                   BOOST_LOG_SEV(self->lg, trivial::warning)
                       << "tunnel to " << route.device_id << ':'
                       << route.device_port << " failed: " << err;
                   self->Respond(
                       TextResponse(http::status::not_found, err.what));
                   return;
                 }
                 self->Forward(local_port, req);
               }));
  }

  void Forward(std::uint16_t local_port, ProxyRequest req) {
    ReverseProxy::Client client;
    client.stream = &stream_;
    client.address = client_address_;
    client.set_cookie = cookie_;
    if (IsUpgradeRequest(req)) {
      client.pending = beast::buffers_to_string(buffer_.data());
      buffer_.consume(buffer_.size());
    }
    service_->proxy_.forward(
        local_port, std::move(req), std::move(client),
        PostTo(stream_.get_executor(),
               [self = shared_from_this()](Error err,
                                           ReverseProxy::Outcome outcome) {
                 switch (outcome) {
                   case ReverseProxy::Outcome::not_sent:
                     self->Respond(
                         TextResponse(http::status::bad_gateway, err.what));
                     return;
                   case ReverseProxy::Outcome::reusable:
                     self->cookie_.reset();
                     self->DoRead();
                     return;
                   case ReverseProxy::Outcome::finished:
                     self->Close();
                     return;
                   case ReverseProxy::Outcome::upgraded:
                     // The socket went to the splice.
                     return;
                 }
               }));
  }

  void Respond(ProxyResponse res) {
    res.version(version_);
    res.keep_alive(keep_alive_);
    if (cookie_) {
      res.set(http::field::set_cookie, *cookie_);
    }
    if (!head_) {
      res.prepare_payload();
    }
    auto sp = std::make_shared<ProxyResponse>(std::move(res));
    stream_.expires_after(std::chrono::seconds(60));
    http::async_write(stream_, *sp,
                      [self = shared_from_this(), sp](
                          const beast::error_code &ec, std::size_t) {
                        if (ec || !sp->keep_alive()) {
                          self->Close();
                          return;
                        }
                        self->cookie_.reset();
                        self->DoRead();
                      });
  }

  void Close() {
    boost::system::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
    stream_.socket().close(ignored);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::shared_ptr<BrokerService> service_;
  std::string client_address_;
  std::optional<std::string> cookie_;
  unsigned version_{11};
  bool keep_alive_{false};
  bool head_{false};
  src::severity_logger<trivial::severity_level> lg;
};

BrokerService::BrokerService(net::any_io_executor executor,
                             api::IManagementApi &api, ConnectionCache &cache,
                             AuthGate &auth, ITunnelSource &tunnels,
                             ReverseProxy &proxy,
                             customio::ConsoleOutput &output, Options options)
    : executor_(executor), strand_(net::make_strand(executor)), api_(api),
      cache_(cache), auth_(auth), tunnels_(tunnels), proxy_(proxy),
      output_(output), options_(std::move(options)), acceptor_(strand_),
      reauth_timer_(strand_) {}

void BrokerService::start(Completion handler) {
  net::post(strand_, [self = shared_from_this(),
                      handler = std::move(handler)]() mutable {
    if (self->finished_) {
      handler(Error{});
      return;
    }
    self->handler_ = std::move(handler);

    boost::system::error_code ec;
    auto address = net::ip::make_address(self->options_.listen_address, ec);
    if (ec) {
      self->Finish(make_error(
          my_errors::GENERAL::INVALID_ARGUMENT,
          fmt::format("invalid listen address {}: {}",
                      self->options_.listen_address, ec.message())));
      return;
    }
    tcp::endpoint endpoint(address, self->options_.listen_port);
    auto &acceptor = self->acceptor_;
    acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
      acceptor.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
      acceptor.bind(endpoint, ec);
    }
    if (!ec) {
      acceptor.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
      self->Finish(make_error(
          my_errors::TUNNEL::BIND_FAILED,
          fmt::format("error starting broker: listen tcp {}:{}: {}",
                      self->options_.listen_address,
                      self->options_.listen_port, ec.message())));
      return;
    }
    self->port_.store(acceptor.local_endpoint(ec).port());

    if (!self->auth_.enabled()) {
      self->output_.warning()
          << "Warning: No authentication token provided. Device access "
             "will be open";
    }
    self->output_.info() << "Broker listening on "
                         << self->options_.listen_address << ':'
                         << self->port_.load();
    BOOST_LOG_SEV(self->lg, trivial::info)
        << "broker listening on port " << self->port_.load();

    if (self->options_.gc_interval.count() > 0) {
      self->cache_.start_gc(self->executor_, self->options_.gc_interval);
    }
    self->ScheduleReauth();
    self->DoAccept();
  });
}

void BrokerService::stop() {
  net::post(strand_, [self = shared_from_this()]() { self->Finish(Error{}); });
}

void BrokerService::DoAccept() {
  acceptor_.async_accept(
      net::make_strand(executor_),
      [self = shared_from_this()](boost::system::error_code ec,
                                  tcp::socket socket) {
        if (self->finished_) {
          return;
        }
        if (ec) {
          if (ec == net::error::operation_aborted) {
            return;
          }
          BOOST_LOG_SEV(self->lg, trivial::warning)
              << "broker accept failed: " << ec.message();
        } else {
          std::make_shared<Session>(std::move(socket), self)->Run();
        }
        self->DoAccept();
      });
}

void BrokerService::ScheduleReauth() {
  if (options_.reauth_interval.count() <= 0) {
    return;
  }
  reauth_timer_.expires_after(options_.reauth_interval);
  reauth_timer_.async_wait([self = shared_from_this()](
                               boost::system::error_code ec) {
    if (ec || self->finished_) {
      return;
    }
    self->api_.async_authenticate(
        PostTo(self->strand_, [self](Error err) {
          if (self->finished_) {
            return;
          }
          if (err) {
            self->Finish(make_error(
                err.code, fmt::format("error re-authenticating: {}", err.what)));
            return;
          }
          BOOST_LOG_SEV(self->lg, trivial::info)
              << "management API session renewed";
          self->ScheduleReauth();
        }));
  });
}

void BrokerService::Finish(Error err) {
  if (finished_) {
    return;
  }
  finished_ = true;
  boost::system::error_code ignored;
  acceptor_.close(ignored);
  reauth_timer_.cancel();
  cache_.stop_gc();
  const auto closed = cache_.clear();
  BOOST_LOG_SEV(lg, trivial::info)
      << "broker stopped, closed " << closed << " tunnel(s)";
  if (err) {
    BOOST_LOG_SEV(lg, trivial::error) << "broker failed: " << err;
  }
  if (handler_) {
    auto handler = std::move(handler_);
    handler(std::move(err));
  }
}

}  // namespace qbeecli::broker
