#include "tunnel/device_connector.hpp"

#include <boost/asio/post.hpp>

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "util/post_to.hpp"

namespace qbeecli {
namespace net = boost::asio;

DeviceConnector::DeviceConnector(net::any_io_executor executor,
                                 api::IManagementApi &api,
                                 transport::ITransportClient &transport_client,
                                 ITerminal &terminal,
                                 IResizeWatcher &resize_watcher,
                                 customio::ConsoleOutput &output,
                                 int keepalive_seconds)
    : strand_(net::make_strand(executor)), api_(api),
      transport_client_(transport_client), terminal_(terminal),
      resize_watcher_(resize_watcher), output_(output),
      keepalive_seconds_(keepalive_seconds), resolver_(strand_, api) {}

void DeviceConnector::async_connect(std::string device_id,
                                    std::vector<RemoteAccessTarget> targets,
                                    Completion handler) {
  net::post(strand_, [self = shared_from_this(), device_id = std::move(device_id),
                      targets = std::move(targets),
                      handler = std::move(handler)]() mutable {
    self->Begin(device_id, std::move(handler),
                [self, targets = std::move(targets)](EdgeTarget edge) {
                  self->bridge_ = std::make_shared<TunnelBridge>(
                      self->strand_, self->session_, edge.device_uuid,
                      self->output_);
                  self->bridge_->start(
                      targets, PostTo(self->strand_, [self](Error err) {
                        self->Complete(std::move(err));
                      }));
                });
  });
}

void DeviceConnector::async_terminal(std::string device_id, std::string command,
                                     std::vector<std::string> command_args,
                                     Completion handler) {
  net::post(strand_, [self = shared_from_this(), device_id = std::move(device_id),
                      command = std::move(command),
                      command_args = std::move(command_args),
                      handler = std::move(handler)]() mutable {
    self->Begin(device_id, std::move(handler),
                [self, command = std::move(command),
                 command_args = std::move(command_args)](EdgeTarget) {
                  self->terminal_session_ = std::make_shared<TerminalSession>(
                      self->strand_, self->session_, self->terminal_,
                      self->resize_watcher_, self->output_);
                  self->terminal_session_->start(
                      command, command_args,
                      PostTo(self->strand_, [self](Error err) {
                        self->Complete(std::move(err));
                      }));
                });
  });
}

void DeviceConnector::stop() {
  net::post(strand_, [self = shared_from_this()]() {
    if (self->stopped_) {
      return;
    }
    self->stopped_ = true;
    if (self->bridge_) {
      self->bridge_->stop();
    } else if (self->terminal_session_) {
      self->terminal_session_->stop();
    }
    // Resolution and session setup notice stopped_ when they complete.
  });
}

void DeviceConnector::Begin(const std::string &device_id, Completion handler,
                            SessionReady on_ready) {
  if (busy_) {
    net::post(strand_, [handler = std::move(handler)]() {
      handler(make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                         "connector already running"));
    });
    return;
  }
  busy_ = true;
  handler_ = std::move(handler);
  if (stopped_) {
    Complete(Error{});
    return;
  }
  BOOST_LOG_SEV(lg, trivial::info) << "resolving device " << device_id;
  resolver_.async_resolve(
      device_id,
      PostTo(strand_, [self = shared_from_this(), on_ready = std::move(on_ready)](
                          Error err, EdgeTarget edge) {
        if (self->stopped_) {
          self->Complete(Error{});
          return;
        }
        if (err) {
          self->Complete(std::move(err));
          return;
        }
        if (edge.edge_version != api::EdgeVersion::native) {
          self->Complete(make_error(
              my_errors::TRANSPORT::LEGACY_UNSUPPORTED,
              fmt::format("unsupported edge version {}: legacy remote access "
                          "is not supported",
                          static_cast<int>(edge.edge_version))));
          return;
        }
        self->OpenSession(std::move(edge), on_ready);
      }));
}

void DeviceConnector::OpenSession(EdgeTarget edge, SessionReady on_ready) {
  transport::SessionOptions options;
  options.url = edge.edge_url;
  options.auth_token = api_.auth_token();
  options.relaxed_tls = edge.relaxed_tls;
  options.keepalive_seconds = keepalive_seconds_;
  BOOST_LOG_SEV(lg, trivial::info) << "opening session to " << options.url;
  transport_client_.async_connect(
      options,
      PostTo(strand_, [self = shared_from_this(), edge = std::move(edge),
                       on_ready = std::move(on_ready)](
                          boost::system::error_code ec,
                          transport::SessionPtr session) {
        if (self->stopped_) {
          if (session) {
            session->close();
          }
          self->Complete(Error{});
          return;
        }
        if (ec) {
          self->Complete(make_error(
              my_errors::TRANSPORT::SESSION_OPEN_FAILED,
              fmt::format("error initializing remote access client: {}",
                          ec.message())));
          return;
        }
        self->session_ = std::move(session);
        on_ready(edge);
      }));
}

void DeviceConnector::Complete(Error err) {
  if (session_) {
    session_->close();
    session_.reset();
  }
  bridge_.reset();
  terminal_session_.reset();
  busy_ = false;
  if (handler_) {
    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(std::move(err));
  }
}

}  // namespace qbeecli
