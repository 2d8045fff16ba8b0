#include "handlers/terminal_handler.hpp"

#include <boost/json.hpp>

#include <fmt/format.h>

#include <sstream>
#include <stdexcept>

#include "my_error_codes.hpp"

namespace qbeecli {
namespace json = boost::json;

std::vector<std::string> ParseShellCommand(const std::string &json_argv) {
  std::vector<std::string> argv;
  if (json_argv.empty()) {
    return argv;
  }
  boost::system::error_code ec;
  auto jv = json::parse(json_argv, ec);
  if (ec) {
    throw std::invalid_argument(
        fmt::format("invalid command {}: {}", json_argv, ec.message()));
  }
  auto *arr = jv.if_array();
  if (!arr) {
    throw std::invalid_argument(
        fmt::format("invalid command {}: expected a JSON array", json_argv));
  }
  for (const auto &item : *arr) {
    if (!item.is_string()) {
      throw std::invalid_argument(fmt::format(
          "invalid command {}: every element must be a string", json_argv));
    }
    argv.emplace_back(item.as_string().c_str());
  }
  return argv;
}

std::shared_ptr<IDeviceConnector>
StartTerminal(IConnectorFactory &connector_factory,
              const std::string &device_id,
              const std::vector<std::string> &argv, Completion handler) {
  std::string command;
  std::vector<std::string> args;
  if (!argv.empty()) {
    command = argv.front();
    args.assign(argv.begin() + 1, argv.end());
  }
  auto connector = connector_factory.create();
  connector->async_terminal(device_id, std::move(command), std::move(args),
                            std::move(handler));
  return connector;
}

TerminalHandler::TerminalHandler(api::IManagementApi &api,
                                 IConnectorFactory &connector_factory,
                                 CliCtx &cli_ctx,
                                 customio::ConsoleOutput &output_hub)
    : api_(api), connector_factory_(connector_factory),
      output_hub_(output_hub), cli_ctx_(cli_ctx),
      opt_desc_("term options") {
  opt_desc_.add_options()                                     //
      ("device,d", po::value<std::string>(&options_.device_id),
       "Device ID (public key digest)")                       //
      ("command", po::value<std::string>(&options_.command),
       "Command to execute as JSON string, e.g. '[\"ls\",\"-la\"]'");
}

std::string TerminalHandler::print_opt_desc() const {
  std::ostringstream oss;
  oss << "Usage: qbee-cli " << command() << " --device <id> [--command <json>]"
      << std::endl
      << opt_desc_;
  return oss.str();
}

void TerminalHandler::start(Completion handler) {
#ifdef _WIN32
  handler(make_error(my_errors::TUNNEL::TERMINAL_ERROR,
                     "shell is not supported on Windows"));
  return;
#endif
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
  if (options_.device_id.empty()) {
    handler(make_error(my_errors::GENERAL::SHOW_OPT_DESC,
                       fmt::format("missing device ID\n{}", print_opt_desc())));
    return;
  }

  std::vector<std::string> argv;
  try {
    ValidateDeviceID(options_.device_id);
    argv = ParseShellCommand(options_.command);
  } catch (const TargetParseError &ex) {
    handler(ex.to_error());
    return;
  } catch (const std::invalid_argument &ex) {
    handler(make_error(my_errors::GENERAL::INVALID_ARGUMENT, ex.what()));
    return;
  }

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
    BOOST_LOG_SEV(self->lg, trivial::info)
        << "opening terminal on " << self->options_.device_id;
    self->connector_ = StartTerminal(self->connector_factory_,
                                     self->options_.device_id, argv,
                                     std::move(handler));
  });
}

void TerminalHandler::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  stopped_ = true;
  if (connector_) {
    connector_->stop();
  }
}

}  // namespace qbeecli
