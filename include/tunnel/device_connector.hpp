#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

#include <memory>
#include <string>
#include <vector>

#include "api/management_api.hpp"
#include "conf/connect_config.hpp"
#include "customio/console_output.hpp"
#include "qbee_error.hpp"
#include "transport/transport.hpp"
#include "tunnel/device_status_resolver.hpp"
#include "tunnel/remote_access_target.hpp"
#include "tunnel/resize_watcher.hpp"
#include "tunnel/terminal_session.hpp"
#include "tunnel/tunnel_bridge.hpp"
#include "util/io_context_manager.hpp"
#include "util/my_logging.hpp"
#include "util/terminal.hpp"

namespace qbeecli {

// One connect cycle for one device: resolve the edge, open a session and
// run a tunnel bridge or a terminal on it. The session is closed when the
// cycle completes.
class IDeviceConnector {
 public:
  virtual ~IDeviceConnector() = default;

  virtual void async_connect(std::string device_id,
                             std::vector<RemoteAccessTarget> targets,
                             Completion handler) = 0;
  virtual void async_terminal(std::string device_id, std::string command,
                              std::vector<std::string> command_args,
                              Completion handler) = 0;
  // Cancels whatever stage is running. The pending cycle completes cleanly.
  virtual void stop() = 0;
};

class IConnectorFactory {
 public:
  virtual ~IConnectorFactory() = default;
  virtual std::shared_ptr<IDeviceConnector> create() = 0;
};

class DeviceConnector : public IDeviceConnector,
                        public std::enable_shared_from_this<DeviceConnector> {
 public:
  DeviceConnector(boost::asio::any_io_executor executor,
                  api::IManagementApi &api,
                  transport::ITransportClient &transport_client,
                  ITerminal &terminal, IResizeWatcher &resize_watcher,
                  customio::ConsoleOutput &output, int keepalive_seconds);

  void async_connect(std::string device_id,
                     std::vector<RemoteAccessTarget> targets,
                     Completion handler) override;
  void async_terminal(std::string device_id, std::string command,
                      std::vector<std::string> command_args,
                      Completion handler) override;
  void stop() override;

 private:
  using SessionReady = std::function<void(EdgeTarget)>;

  void Begin(const std::string &device_id, Completion handler,
             SessionReady on_ready);
  void OpenSession(EdgeTarget edge, SessionReady on_ready);
  void Complete(Error err);

  boost::asio::strand<boost::asio::any_io_executor> strand_;
  api::IManagementApi &api_;
  transport::ITransportClient &transport_client_;
  ITerminal &terminal_;
  IResizeWatcher &resize_watcher_;
  customio::ConsoleOutput &output_;
  int keepalive_seconds_;
  DeviceStatusResolver resolver_;
  Completion handler_;
  transport::SessionPtr session_;
  std::shared_ptr<TunnelBridge> bridge_;
  std::shared_ptr<TerminalSession> terminal_session_;
  bool busy_{false};
  bool stopped_{false};
  src::severity_logger<trivial::severity_level> lg;
};

class DeviceConnectorFactory : public IConnectorFactory {
 public:
  DeviceConnectorFactory(IoContextManager &io_context_manager,
                         api::IManagementApi &api,
                         transport::ITransportClient &transport_client,
                         ITerminal &terminal, IResizeWatcher &resize_watcher,
                         customio::ConsoleOutput &output,
                         IConnectConfigProvider &config_provider)
      : io_context_manager_(io_context_manager), api_(api),
        transport_client_(transport_client), terminal_(terminal),
        resize_watcher_(resize_watcher), output_(output),
        config_provider_(config_provider) {}

  std::shared_ptr<IDeviceConnector> create() override {
    return std::make_shared<DeviceConnector>(
        io_context_manager_.ioc().get_executor(), api_, transport_client_,
        terminal_, resize_watcher_, output_,
        config_provider_.get().keepalive_seconds);
  }

 private:
  IoContextManager &io_context_manager_;
  api::IManagementApi &api_;
  transport::ITransportClient &transport_client_;
  ITerminal &terminal_;
  IResizeWatcher &resize_watcher_;
  customio::ConsoleOutput &output_;
  IConnectConfigProvider &config_provider_;
};

}  // namespace qbeecli
