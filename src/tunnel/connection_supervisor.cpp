#include "tunnel/connection_supervisor.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "util/post_to.hpp"

namespace qbeecli {
namespace net = boost::asio;

std::string FormatBackoff(std::chrono::milliseconds delay) {
  const auto minutes = delay.count() / 60000;
  const double seconds = static_cast<double>(delay.count() % 60000) / 1000.0;
  if (minutes > 0) {
    return fmt::format("{}m{:.1f}s", minutes, seconds);
  }
  return fmt::format("{:.1f}s", seconds);
}

ConnectionSupervisor::ConnectionSupervisor(net::any_io_executor executor,
                                           IConnectorFactory &connector_factory,
                                           customio::ConsoleOutput &output,
                                           BackoffPolicy backoff)
    : strand_(net::make_strand(executor)),
      connector_factory_(connector_factory), output_(output),
      backoff_(backoff) {}

void ConnectionSupervisor::run(std::vector<DeviceConnection> connections,
                               bool allow_failures, int retries,
                               Completion handler) {
  net::post(strand_, [self = shared_from_this(),
                      connections = std::move(connections), allow_failures,
                      retries, handler = std::move(handler)]() mutable {
    self->handler_ = std::move(handler);
    self->allow_failures_ = allow_failures;
    self->retries_ = retries;
    self->DoRun(std::move(connections));
  });
}

void ConnectionSupervisor::stop() {
  net::post(strand_, [self = shared_from_this()]() {
    self->StopAll();
    if (self->handler_ && self->remaining_ == 0) {
      self->Complete(Error{});
    }
  });
}

void ConnectionSupervisor::DoRun(std::vector<DeviceConnection> connections) {
  if (retries_ < 0) {
    Complete(make_error(my_errors::TARGET::INVALID_RETRIES,
                        "retries must be a positive number"));
    return;
  }
  if (stopping_) {
    Complete(Error{});
    return;
  }
  for (auto &conn : connections) {
    auto device = std::make_shared<Device>();
    device->id = conn.device_id;
    device->log = make_logger_with_device(conn.device_id);
    try {
      ValidateDeviceID(conn.device_id);
      device->targets = ParseTargetList(conn.targets);
    } catch (const TargetParseError &ex) {
      Error err = make_error(ex.code(),
                             fmt::format("error connecting to device {}: {}",
                                         conn.device_id, ex.message()));
      if (!allow_failures_) {
        devices_.clear();
        Complete(std::move(err));
        return;
      }
      output_.error() << err.what;
      continue;
    }
    devices_.push_back(std::move(device));
  }
  remaining_ = devices_.size();
  if (remaining_ == 0) {
    Complete(Error{});
    return;
  }
  BOOST_LOG_SEV(lg, trivial::info)
      << "supervising " << remaining_ << " device(s), retries=" << retries_
      << ", allow_failures=" << allow_failures_;
  for (const auto &device : devices_) {
    Attempt(device);
  }
}

void ConnectionSupervisor::Attempt(const DevicePtr &device) {
  ++device->attempts;
  BOOST_LOG_SEV(*device->log, trivial::debug)
      << "attempt " << device->attempts;
  device->connector = connector_factory_.create();
  device->connector->async_connect(
      device->id, device->targets,
      PostTo(strand_, [self = shared_from_this(), device](Error err) {
        self->OnAttemptDone(device, std::move(err));
      }));
}

void ConnectionSupervisor::OnAttemptDone(const DevicePtr &device, Error err) {
  device->connector.reset();
  if (!err || stopping_) {
    DeviceDone(device, Error{});
    return;
  }
  output_.error() << "error connecting to device " << device->id << ": "
                  << err.what;
  if (retries_ > 0 && device->attempts >= retries_) {
    DeviceDone(device, std::move(err));
    return;
  }
  const auto delay = backoff_.delay_for(device->attempts, rng_);
  output_.info() << "Attempt " << device->attempts << " failed. Retrying in "
                 << FormatBackoff(delay) << "...";
  BOOST_LOG_SEV(*device->log, trivial::info)
      << "attempt " << device->attempts << " failed: " << err
      << ", retrying in " << delay.count() << "ms";
  device->backoff_timer = std::make_unique<net::steady_timer>(strand_);
  device->backoff_timer->expires_after(delay);
  device->backoff_timer->async_wait(
      [self = shared_from_this(), device](boost::system::error_code ec) {
        device->backoff_timer.reset();
        if (ec || self->stopping_) {
          self->DeviceDone(device, Error{});
          return;
        }
        self->Attempt(device);
      });
}

void ConnectionSupervisor::DeviceDone(const DevicePtr &device, Error err) {
  if (device->done) {
    return;
  }
  device->done = true;
  --remaining_;
  if (err) {
    Error wrapped{err.code, fmt::format("error connecting to device {}: {}",
                                        device->id, err.what)};
    BOOST_LOG_SEV(*device->log, trivial::warning) << wrapped.what;
    if (!allow_failures_ && !first_error_) {
      first_error_ = std::move(wrapped);
      StopAll();
    }
  }
  if (remaining_ == 0) {
    Complete(first_error_);
  }
}

void ConnectionSupervisor::StopAll() {
  if (stopping_) {
    return;
  }
  stopping_ = true;
  for (const auto &device : devices_) {
    if (device->connector) {
      device->connector->stop();
    }
    if (device->backoff_timer) {
      device->backoff_timer->cancel();
    }
  }
}

void ConnectionSupervisor::Complete(Error err) {
  if (completed_) {
    return;
  }
  completed_ = true;
  if (handler_) {
    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(std::move(err));
  }
}

}  // namespace qbeecli
