#include "tunnel/tunnel_bridge.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <unistd.h>

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "transport/local_stream.hpp"
#include "tunnel/udp_relay.hpp"
#include "util/post_to.hpp"

namespace qbeecli {
namespace net = boost::asio;
using tcp = net::ip::tcp;
using udp = net::ip::udp;

namespace {

// Pause before accepting again after a failed accept, e.g. on EMFILE.
constexpr auto kAcceptRetryDelay = std::chrono::milliseconds(100);

// Prefers an IPv4 address so that "localhost" binds where clients dial.
template <typename Protocol>
typename Protocol::endpoint
ResolveLocal(net::any_io_executor executor, const std::string &host,
             const std::string &port, boost::system::error_code &ec) {
  typename Protocol::resolver resolver(executor);
  auto results = resolver.resolve(host, port, ec);
  if (ec) {
    return {};
  }
  typename Protocol::endpoint chosen;
  bool found = false;
  for (const auto &entry : results) {
    if (!found || (entry.endpoint().address().is_v4() &&
                   !chosen.address().is_v4())) {
      chosen = entry.endpoint();
      found = true;
    }
  }
  if (!found) {
    ec = net::error::host_not_found;
  }
  return chosen;
}

}  // namespace

TunnelBridge::TunnelBridge(net::any_io_executor executor,
                           transport::SessionPtr session, std::string device_id,
                           customio::ConsoleOutput &output)
    : strand_(net::make_strand(executor)), session_(std::move(session)),
      device_id_(std::move(device_id)), output_(output) {}

void TunnelBridge::start(std::vector<RemoteAccessTarget> targets,
                         Completion handler) {
  net::post(strand_, [self = shared_from_this(), targets = std::move(targets),
                      handler = std::move(handler)]() mutable {
    self->handler_ = std::move(handler);
    if (self->finished_) {
      auto h = std::move(self->handler_);
      h(Error{});
      return;
    }
    self->DoStart(std::move(targets));
  });
}

void TunnelBridge::stop() {
  net::post(strand_, [self = shared_from_this()]() {
    if (self->started_ && !self->finished_) {
      self->output_.info() << "Connection closed";
    }
    self->Finish(Error{});
  });
}

void TunnelBridge::DoStart(std::vector<RemoteAccessTarget> targets) {
  started_ = true;
  if (targets.empty()) {
    Finish(make_error(my_errors::TARGET::NO_TARGETS, "no targets defined"));
    return;
  }
  if (targets.size() == 1 && targets.front().is_stdio()) {
    StartStdio(targets.front());
    return;
  }
  for (const auto &target : targets) {
    if (target.is_stdio()) {
      Finish(make_error(my_errors::TARGET::STDIO_NOT_EXCLUSIVE,
                        "stdio is only supported for single target "
                        "connections"));
      return;
    }
  }
  for (const auto &target : targets) {
    Error err = target.protocol == Protocol::udp ? ListenUdp(target)
                                                 : ListenTcp(target);
    if (err) {
      Finish(std::move(err));
      return;
    }
    output_.info() << "Tunneling " << to_string(target.protocol) << ' '
                   << target.local_address() << " to "
                   << target.remote_address();
  }
  WatchSession();
}

void TunnelBridge::StartStdio(const RemoteAccessTarget &target) {
  if (!stdio_stream_) {
    try {
      stdio_stream_ = std::make_shared<transport::DescriptorStream>(
          strand_, STDIN_FILENO, STDOUT_FILENO);
    } catch (const boost::system::system_error &ex) {
      Finish(make_error(ex.code(),
                        fmt::format("error attaching stdio: {}", ex.what())));
      return;
    }
  }
  BOOST_LOG_SEV(lg, trivial::info)
      << "stdio tunnel to " << target.remote_address() << " on device "
      << device_id_;
  session_->async_open_stream(
      transport::MessageType::tcp_tunnel, target.remote_address(),
      PostTo(strand_, [self = shared_from_this()](
                          boost::system::error_code ec,
                          transport::StreamPtr stream, std::string reply) {
        if (self->finished_) {
          if (stream) {
            stream->close();
          }
          return;
        }
        if (ec) {
          Error err = make_error(
              my_errors::TRANSPORT::STREAM_OPEN_FAILED,
              fmt::format("error opening stream: {}",
                          reply.empty() ? ec.message() : reply));
          self->Finish(std::move(err));
          return;
        }
        auto splice = Splice::Start(
            self->stdio_stream_, std::move(stream),
            PostTo(self->strand_, [self](boost::system::error_code ec) {
              if (ec && ec != net::error::operation_aborted) {
                self->Finish(make_error(
                    ec, fmt::format("stdio tunnel: {}", ec.message())));
                return;
              }
              self->Finish(Error{});
            }));
        self->splices_.emplace(self->next_splice_id_++, std::move(splice));
      }));
}

Error TunnelBridge::ListenTcp(const RemoteAccessTarget &target) {
  boost::system::error_code ec;
  auto endpoint =
      ResolveLocal<tcp>(strand_, target.local_host, target.local_port, ec);
  auto acceptor = std::make_shared<tcp::acceptor>(strand_);
  if (!ec) {
    acceptor->open(endpoint.protocol(), ec);
  }
  if (!ec) {
    acceptor->set_option(net::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor->bind(endpoint, ec);
  }
  if (!ec) {
    acceptor->listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    return make_error(my_errors::TUNNEL::BIND_FAILED,
                      fmt::format("error opening TCP tunnel: listen tcp {}: {}",
                                  target.local_address(), ec.message()));
  }
  acceptors_.push_back(acceptor);
  Accept(std::move(acceptor), target);
  return {};
}

Error TunnelBridge::ListenUdp(const RemoteAccessTarget &target) {
  boost::system::error_code ec;
  auto endpoint =
      ResolveLocal<udp>(strand_, target.local_host, target.local_port, ec);
  udp::socket socket(strand_);
  if (!ec) {
    socket.open(endpoint.protocol(), ec);
  }
  if (!ec) {
    socket.bind(endpoint, ec);
  }
  if (ec) {
    return make_error(my_errors::TUNNEL::BIND_FAILED,
                      fmt::format("error opening UDP tunnel: listen udp {}: {}",
                                  target.local_address(), ec.message()));
  }
  auto relay = std::make_shared<UdpRelay>(strand_, std::move(socket), session_,
                                          target.remote_address(),
                                          udp_idle_timeout_);
  relay->start();
  udp_relays_.push_back(std::move(relay));
  return {};
}

void TunnelBridge::Accept(std::shared_ptr<tcp::acceptor> acceptor,
                          RemoteAccessTarget target) {
  auto *raw = acceptor.get();
  raw->async_accept([self = shared_from_this(), acceptor = std::move(acceptor),
                     target = std::move(target)](boost::system::error_code ec,
                                                 tcp::socket socket) mutable {
    if (self->finished_) {
      return;
    }
    if (ec) {
      if (ec != net::error::operation_aborted) {
        BOOST_LOG_SEV(self->lg, trivial::warning)
            << "accept on " << target.local_address()
            << " failed: " << ec.message();
        self->RetryAccept(std::move(acceptor), std::move(target));
      }
      return;
    }
    self->OnAccepted(std::move(socket), target);
    self->Accept(std::move(acceptor), std::move(target));
  });
}

void TunnelBridge::RetryAccept(std::shared_ptr<tcp::acceptor> acceptor,
                               RemoteAccessTarget target) {
  auto timer = std::make_shared<net::steady_timer>(strand_, kAcceptRetryDelay);
  retry_timers_.insert(timer);
  timer->async_wait(net::bind_executor(
      strand_, [self = shared_from_this(), timer, acceptor = std::move(acceptor),
                target = std::move(target)](
                   boost::system::error_code ec) mutable {
        self->retry_timers_.erase(timer);
        if (ec || self->finished_) {
          return;
        }
        self->Accept(std::move(acceptor), std::move(target));
      }));
}

void TunnelBridge::OnAccepted(tcp::socket socket,
                              const RemoteAccessTarget &target) {
  auto local = std::make_shared<transport::SocketStream>(std::move(socket));
  BOOST_LOG_SEV(lg, trivial::debug)
      << "connection on " << target.local_address() << ", opening stream to "
      << target.remote_address();
  session_->async_open_stream(
      transport::MessageType::tcp_tunnel, target.remote_address(),
      PostTo(strand_, [self = shared_from_this(), local,
                       remote_address = target.remote_address()](
                          boost::system::error_code ec,
                          transport::StreamPtr stream, std::string reply) {
        if (self->finished_) {
          local->close();
          if (stream) {
            stream->close();
          }
          return;
        }
        if (ec) {
          BOOST_LOG_SEV(self->lg, trivial::warning)
              << "error opening stream to " << remote_address << ": "
              << ec.message() << (reply.empty() ? "" : " ") << reply;
          self->output_.warning()
              << "error opening stream to " << remote_address << ": "
              << (reply.empty() ? ec.message() : reply);
          local->close();
          return;
        }
        self->TrackSplice(local, std::move(stream));
      }));
}

void TunnelBridge::TrackSplice(std::shared_ptr<transport::IStream> local,
                               transport::StreamPtr remote) {
  const auto id = next_splice_id_++;
  auto splice = Splice::Start(
      std::move(local), std::move(remote),
      PostTo(strand_, [self = shared_from_this(), id](
                          boost::system::error_code ec) {
        if (ec && ec != net::error::operation_aborted) {
          BOOST_LOG_SEV(self->lg, trivial::debug)
              << "tunnel connection ended: " << ec.message();
        }
        self->splices_.erase(id);
      }));
  splices_.emplace(id, std::move(splice));
}

void TunnelBridge::WatchSession() {
  session_->async_accept_stream(PostTo(
      strand_, [self = shared_from_this()](boost::system::error_code ec,
                                           transport::StreamPtr stream) {
        if (self->finished_) {
          if (stream) {
            stream->close();
          }
          return;
        }
        if (ec) {
          self->Finish(make_error(
              my_errors::TRANSPORT::SESSION_CLOSED,
              fmt::format("session error for device {}: {}", self->device_id_,
                          ec.message())));
          return;
        }
        // The device never opens streams towards the client.
        stream->close();
        self->WatchSession();
      }));
}

void TunnelBridge::Finish(Error err) {
  if (finished_) {
    return;
  }
  finished_ = true;
  boost::system::error_code ignored;
  for (auto &acceptor : acceptors_) {
    acceptor->close(ignored);
  }
  acceptors_.clear();
  for (const auto &timer : retry_timers_) {
    timer->cancel();
  }
  retry_timers_.clear();
  for (auto &relay : udp_relays_) {
    relay->close();
  }
  udp_relays_.clear();
  auto splices = std::move(splices_);
  splices_.clear();
  for (auto &[id, splice] : splices) {
    splice->close();
  }
  if (stdio_stream_) {
    stdio_stream_->close();
  }
  if (err) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "tunnel bridge for " << device_id_ << " ended: " << err.what;
  } else {
    BOOST_LOG_SEV(lg, trivial::info)
        << "tunnel bridge for " << device_id_ << " stopped";
  }
  if (handler_) {
    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(std::move(err));
  }
}

}  // namespace qbeecli
