#include "handlers/connect_handler.hpp"

#include <fmt/format.h>

#include <sstream>
#include <stdexcept>

#include "handlers/terminal_handler.hpp"
#include "my_error_codes.hpp"

namespace qbeecli {

ConnectHandler::ConnectHandler(IoContextManager &io_context_manager,
                               IConnectConfigProvider &connect_config_provider,
                               api::IManagementApi &api,
                               IConnectorFactory &connector_factory,
                               CliCtx &cli_ctx,
                               customio::ConsoleOutput &output_hub)
    : io_context_manager_(io_context_manager),
      connect_config_provider_(connect_config_provider), api_(api),
      connector_factory_(connector_factory), output_hub_(output_hub),
      cli_ctx_(cli_ctx), opt_desc_("connect options") {
  opt_desc_.add_options()                                       //
      ("device,d", po::value<std::string>(&options_.device_id),
       "Device ID (public key digest)")                         //
      ("target,t", po::value<std::string>(&options_.targets),
       "Comma-separated targets "
       "[<localHost>:]<localPort>:<remoteHost>:<remotePort>[/udp]") //
      ("config", po::value<std::string>(&options_.config_file),
       "JSON file with a list of {device_id, targets}")          //
      ("allow-failures",
       po::bool_switch(&options_.allow_failures)->default_value(false),
       "keep the other devices connected when one fails")        //
      ("retries", po::value<int>(),
       "connection attempts per device, 0 retries forever")      //
      ("shell", po::bool_switch(&options_.shell)->default_value(false),
       "open a terminal on the device instead of forwarding ports") //
      ("command", po::value<std::string>(&options_.command),
       "command to run in the terminal as JSON string");
}

std::string ConnectHandler::print_opt_desc() const {
  std::ostringstream oss;
  oss << "Usage: qbee-cli connect --device <id> --target <t>[,<t>...]"
      << std::endl
      << "       qbee-cli connect --config <file> [--allow-failures]"
      << std::endl
      << opt_desc_;
  return oss.str();
}

std::vector<DeviceConnection> ConnectHandler::CollectConnections() const {
  if (!options_.config_file.empty()) {
    return LoadDeviceConnections(options_.config_file);
  }
  if (options_.device_id.empty()) {
    throw std::invalid_argument("missing device ID");
  }
  if (options_.targets.empty()) {
    throw std::invalid_argument("missing target");
  }
  return {DeviceConnection{options_.device_id, SplitTargets(options_.targets)}};
}

void ConnectHandler::start(Completion handler) {
  if (cli_ctx_.vm.count("help")) {
    handler(make_error(my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()));
    return;
  }
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(cli_ctx_.unrecognized)
                  .options(opt_desc_)
                  .allow_unregistered()
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error &ex) {
    handler(make_error(my_errors::GENERAL::SHOW_OPT_DESC,
                       fmt::format("{}\n{}", ex.what(), print_opt_desc())));
    return;
  }
  if (vm.count("retries")) {
    options_.retries = vm["retries"].as<int>();
  }

  if (options_.shell || !options_.command.empty()) {
    std::vector<std::string> argv;
    try {
      if (options_.device_id.empty()) {
        throw std::invalid_argument("missing device ID");
      }
      ValidateDeviceID(options_.device_id);
      argv = ParseShellCommand(options_.command);
    } catch (const TargetParseError &ex) {
      handler(ex.to_error());
      return;
    } catch (const std::invalid_argument &ex) {
      handler(make_error(my_errors::GENERAL::SHOW_OPT_DESC,
                         fmt::format("{}\n{}", ex.what(), print_opt_desc())));
      return;
    }
    RunTerminal(std::move(argv), std::move(handler));
    return;
  }

  std::vector<DeviceConnection> connections;
  try {
    connections = CollectConnections();
  } catch (const std::invalid_argument &ex) {
    handler(make_error(my_errors::GENERAL::SHOW_OPT_DESC,
                       fmt::format("{}\n{}", ex.what(), print_opt_desc())));
    return;
  } catch (const std::exception &ex) {
    handler(make_error(my_errors::GENERAL::INVALID_ARGUMENT, ex.what()));
    return;
  }
  RunSupervisor(std::move(connections), std::move(handler));
}

void ConnectHandler::RunSupervisor(std::vector<DeviceConnection> connections,
                                   Completion handler) {
  const auto &cfg = connect_config_provider_.get();
  const int retries = options_.retries.value_or(cfg.retries);
  BackoffPolicy backoff{std::chrono::milliseconds(cfg.backoff_base_ms),
                        std::chrono::milliseconds(cfg.backoff_max_ms)};

  api_.async_authenticate([self = shared_from_this(),
                           connections = std::move(connections), retries,
                           backoff, handler = std::move(handler)](
                              Error err) mutable {
    if (err) {
      handler(std::move(err));
      return;
    }
    std::lock_guard<std::mutex> lock(self->mutex_);
    if (self->stopped_) {
      handler(Error{});
      return;
    }
    self->supervisor_ = std::make_shared<ConnectionSupervisor>(
        self->io_context_manager_.ioc().get_executor(),
        self->connector_factory_, self->output_hub_, backoff);
    self->supervisor_->run(std::move(connections),
                           self->options_.allow_failures, retries,
                           std::move(handler));
  });
}

void ConnectHandler::RunTerminal(std::vector<std::string> argv,
                                 Completion handler) {
  api_.async_authenticate([self = shared_from_this(), argv = std::move(argv),
                           handler = std::move(handler)](Error err) mutable {
    if (err) {
      handler(std::move(err));
      return;
    }
    std::lock_guard<std::mutex> lock(self->mutex_);
    if (self->stopped_) {
      handler(Error{});
      return;
    }
    self->terminal_ = StartTerminal(self->connector_factory_,
                                    self->options_.device_id, argv,
                                    std::move(handler));
  });
}

void ConnectHandler::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  stopped_ = true;
  if (supervisor_) {
    supervisor_->stop();
  }
  if (terminal_) {
    terminal_->stop();
  }
}

}  // namespace qbeecli
