#pragma once

#include <boost/program_options.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "api/management_api.hpp"
#include "conf/connect_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "qbeecli_common.hpp"
#include "tunnel/connection_supervisor.hpp"
#include "tunnel/device_connector.hpp"
#include "tunnel/remote_access_target.hpp"
#include "util/io_context_manager.hpp"
#include "util/my_logging.hpp"

namespace qbeecli {

struct ConnectHandlerOptions {
  std::string device_id;
  std::string targets;
  std::string config_file;
  bool allow_failures{false};
  std::optional<int> retries;
  bool shell{false};
  std::string command;
};

// `connect`: forwards local ports to one or more devices, or with --shell /
// --command opens a terminal on a single device instead.
class ConnectHandler : public IHandler,
                       public std::enable_shared_from_this<ConnectHandler> {
  IoContextManager &io_context_manager_;
  IConnectConfigProvider &connect_config_provider_;
  api::IManagementApi &api_;
  IConnectorFactory &connector_factory_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;
  po::options_description opt_desc_;
  ConnectHandlerOptions options_;
  std::mutex mutex_;
  std::shared_ptr<ConnectionSupervisor> supervisor_;
  std::shared_ptr<IDeviceConnector> terminal_;
  bool stopped_{false};
  src::severity_logger<trivial::severity_level> lg;

 public:
  ConnectHandler(IoContextManager &io_context_manager,
                 IConnectConfigProvider &connect_config_provider,
                 api::IManagementApi &api,
                 IConnectorFactory &connector_factory, CliCtx &cli_ctx,
                 customio::ConsoleOutput &output_hub);

  std::string command() const override { return "connect"; }

  std::string print_opt_desc() const;

  void start(Completion handler) override;
  void stop() override;

 private:
  // --config file, else --device with --target. Throws on bad input.
  std::vector<DeviceConnection> CollectConnections() const;
  void RunSupervisor(std::vector<DeviceConnection> connections,
                     Completion handler);
  void RunTerminal(std::vector<std::string> argv, Completion handler);
};

}  // namespace qbeecli
