#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <memory>
#include <random>
#include <string>
#include <vector>

#include "customio/console_output.hpp"
#include "qbee_error.hpp"
#include "tunnel/device_connector.hpp"
#include "tunnel/remote_access_target.hpp"
#include "util/backoff.hpp"
#include "util/my_logging.hpp"

namespace qbeecli {

// Connects many devices at once, each with its own retry loop.
//
// Every device id and target list is parsed before the first connection
// attempt. A device whose cycle completes cleanly is done; a failed cycle is
// retried after a jittered exponential backoff until `retries` attempts were
// made (0 retries forever). Without allow_failures the first failed device
// stops all others and its error completes the run; with it, failures are
// printed and the run completes once every device finished.
class ConnectionSupervisor
    : public std::enable_shared_from_this<ConnectionSupervisor> {
 public:
  ConnectionSupervisor(boost::asio::any_io_executor executor,
                       IConnectorFactory &connector_factory,
                       customio::ConsoleOutput &output,
                       BackoffPolicy backoff = {});

  void run(std::vector<DeviceConnection> connections, bool allow_failures,
           int retries, Completion handler);
  // Cancels every device and pending backoff; the run completes cleanly.
  void stop();

  void seed(std::mt19937::result_type value) { rng_.seed(value); }

 private:
  struct Device {
    std::string id;
    LoggerPtr log;
    std::vector<RemoteAccessTarget> targets;
    std::shared_ptr<IDeviceConnector> connector;
    std::unique_ptr<boost::asio::steady_timer> backoff_timer;
    int attempts{0};
    bool done{false};
  };
  using DevicePtr = std::shared_ptr<Device>;

  void DoRun(std::vector<DeviceConnection> connections);
  void Attempt(const DevicePtr &device);
  void OnAttemptDone(const DevicePtr &device, Error err);
  void DeviceDone(const DevicePtr &device, Error err);
  void StopAll();
  void Complete(Error err);

  boost::asio::strand<boost::asio::any_io_executor> strand_;
  IConnectorFactory &connector_factory_;
  customio::ConsoleOutput &output_;
  BackoffPolicy backoff_;
  std::mt19937 rng_{std::random_device{}()};
  Completion handler_;
  std::vector<DevicePtr> devices_;
  std::size_t remaining_{0};
  bool allow_failures_{false};
  int retries_{1};
  bool stopping_{false};
  bool completed_{false};
  Error first_error_;
  src::severity_logger<trivial::severity_level> lg;
};

// "7.3s", "1m4.2s"
std::string FormatBackoff(std::chrono::milliseconds delay);

}  // namespace qbeecli
