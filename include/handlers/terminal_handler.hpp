#pragma once

#include <boost/program_options.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "api/management_api.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "qbeecli_common.hpp"
#include "tunnel/device_connector.hpp"
#include "util/my_logging.hpp"

namespace qbeecli {

// `--command '["ls", "-la"]'`: a JSON array of strings, the program first.
// Empty input means the login shell. Throws std::invalid_argument.
std::vector<std::string> ParseShellCommand(const std::string &json_argv);

// Opens an interactive terminal on the device. The returned connector
// stops it.
std::shared_ptr<IDeviceConnector>
StartTerminal(IConnectorFactory &connector_factory,
              const std::string &device_id,
              const std::vector<std::string> &argv, Completion handler);

struct TerminalHandlerOptions {
  std::string device_id;
  std::string command;
};

class TerminalHandler : public IHandler,
                        public std::enable_shared_from_this<TerminalHandler> {
  api::IManagementApi &api_;
  IConnectorFactory &connector_factory_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;
  po::options_description opt_desc_;
  TerminalHandlerOptions options_;
  std::mutex mutex_;
  std::shared_ptr<IDeviceConnector> connector_;
  bool stopped_{false};
  src::severity_logger<trivial::severity_level> lg;

 public:
  TerminalHandler(api::IManagementApi &api,
                  IConnectorFactory &connector_factory, CliCtx &cli_ctx,
                  customio::ConsoleOutput &output_hub);

  std::string command() const override { return cli_ctx_.params.subcmd; }

  std::string print_opt_desc() const;

  void start(Completion handler) override;
  void stop() override;
};

}  // namespace qbeecli
