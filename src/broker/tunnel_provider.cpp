#include "broker/tunnel_provider.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "util/post_to.hpp"

namespace qbeecli::broker {
namespace net = boost::asio;
using tcp = net::ip::tcp;

std::uint16_t PickFreePort() {
  net::io_context ioc;
  tcp::acceptor acceptor(ioc);
  tcp::endpoint endpoint(net::ip::address_v4::loopback(), 0);
  acceptor.open(endpoint.protocol());
  acceptor.bind(endpoint);
  return acceptor.local_endpoint().port();
}

struct TunnelProvider::Attempt {
  Attempt(net::any_io_executor executor)
      : poll_timer(executor), deadline(executor), dial(executor) {}

  std::string key;
  std::uint64_t id{0};
  std::uint16_t local_port{0};
  std::shared_ptr<IDeviceConnector> connector;
  net::steady_timer poll_timer;
  net::steady_timer deadline;
  tcp::socket dial;
  bool settled{false};
};

TunnelProvider::TunnelProvider(net::any_io_executor executor,
                               ConnectionCache &cache,
                               DeviceStatusResolver &resolver,
                               IConnectorFactory &connector_factory,
                               Options options)
    : strand_(net::make_strand(executor)), cache_(cache), resolver_(resolver),
      connector_factory_(connector_factory), options_(std::move(options)) {}

void TunnelProvider::acquire(std::string device_id, std::string device_port,
                             PortHandler handler) {
  net::post(strand_, [self = shared_from_this(),
                      device_id = std::move(device_id),
                      device_port = std::move(device_port),
                      handler = std::move(handler)]() mutable {
    const auto key = CacheKey(device_id, device_port);
    if (auto hit = self->cache_.get(key)) {
      handler(Error{}, hit->local_port);
      return;
    }
    auto &waiters = self->waiting_[key];
    waiters.push_back(std::move(handler));
    if (waiters.size() == 1) {
      self->Establish(key, device_id, device_port);
    }
  });
}

void TunnelProvider::Establish(const std::string &key,
                               const std::string &device_id,
                               const std::string &device_port) {
  auto fail = [self = shared_from_this(), key](Error err) {
    auto waiters = std::move(self->waiting_[key]);
    self->waiting_.erase(key);
    for (auto &waiter : waiters) {
      waiter(err, 0);
    }
  };
  resolver_.async_resolve_device_id(
      device_id,
      PostTo(strand_, [self = shared_from_this(), key, device_port,
                       fail](Error err, std::string node_id) {
        if (err) {
          fail(std::move(err));
          return;
        }
        auto attempt = std::make_shared<Attempt>(self->strand_);
        attempt->key = key;
        attempt->id = self->next_tunnel_id_++;
        try {
          attempt->local_port = PickFreePort();
        } catch (const boost::system::system_error &ex) {
          fail(make_error(my_errors::TUNNEL::NO_FREE_PORT,
                          fmt::format("no free local port: {}", ex.what())));
          return;
        }
        RemoteAccessTarget target;
        target.protocol = Protocol::tcp;
        target.local_host = std::string(kDefaultLocalHost);
        target.local_port = std::to_string(attempt->local_port);
        target.remote_host = self->options_.remote_host;
        target.remote_port = device_port;
        BOOST_LOG_SEV(self->lg, trivial::info)
            << "opening tunnel " << key << " on local port "
            << attempt->local_port;

        attempt->connector = self->connector_factory_.create();
        attempt->connector->async_connect(
            node_id, {target}, PostTo(self->strand_, [self, attempt](Error err) {
              if (!attempt->settled) {
                self->Settle(attempt,
                             err ? std::move(err)
                                 : make_error(my_errors::TRANSPORT::SESSION_CLOSED,
                                              "tunnel closed before the port "
                                              "was ready"));
                return;
              }
              // An established tunnel went away.
              BOOST_LOG_SEV(self->lg, trivial::info)
                  << "tunnel " << attempt->key << " closed"
                  << (err ? ": " + err.what : std::string());
              self->cache_.remove_if(attempt->key, attempt->id);
            }));

        attempt->deadline.expires_after(self->options_.port_ready_timeout);
        attempt->deadline.async_wait(
            [self, attempt](boost::system::error_code ec) {
              if (ec || attempt->settled) {
                return;
              }
              self->Settle(attempt,
                           make_error(my_errors::TUNNEL::PORT_NOT_READY,
                                      fmt::format("port {} is not ready",
                                                  attempt->local_port)));
            });
        self->Poll(attempt);
      }));
}

void TunnelProvider::Poll(std::shared_ptr<Attempt> attempt) {
  if (attempt->settled) {
    return;
  }
  boost::system::error_code ignored;
  attempt->dial.close(ignored);
  attempt->dial.async_connect(
      tcp::endpoint(net::ip::address_v4::loopback(), attempt->local_port),
      [self = shared_from_this(), attempt](boost::system::error_code ec) {
        if (attempt->settled) {
          return;
        }
        if (!ec) {
          boost::system::error_code ignored;
          attempt->dial.close(ignored);
          self->Settle(attempt, Error{});
          return;
        }
        attempt->poll_timer.expires_after(self->options_.poll_interval);
        attempt->poll_timer.async_wait(
            [self, attempt](boost::system::error_code ec) {
              if (ec) {
                return;
              }
              self->Poll(attempt);
            });
      });
}

void TunnelProvider::Settle(const std::shared_ptr<Attempt> &attempt,
                            Error err) {
  attempt->settled = true;
  attempt->deadline.cancel();
  attempt->poll_timer.cancel();
  boost::system::error_code ignored;
  attempt->dial.close(ignored);

  if (err) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "tunnel " << attempt->key << " failed: " << err.what;
    // The cycle may still be running; make sure it does not linger.
    attempt->connector->stop();
  } else {
    TunnelHandle handle;
    handle.local_port = attempt->local_port;
    handle.id = attempt->id;
    handle.cancel = [connector = attempt->connector]() { connector->stop(); };
    cache_.add(attempt->key, std::move(handle));
  }

  auto waiters = std::move(waiting_[attempt->key]);
  waiting_.erase(attempt->key);
  for (auto &waiter : waiters) {
    waiter(err, err ? 0 : attempt->local_port);
  }
}

}  // namespace qbeecli::broker
