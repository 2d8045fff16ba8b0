#include "handlers/broker_handler.hpp"

#include <fmt/format.h>

#include <sstream>

#include "my_error_codes.hpp"

namespace qbeecli {

namespace {

bool ParsePort(const std::string &text, std::uint16_t &port) {
  if (text.empty() || text.size() > 5 ||
      text.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  const auto value = std::stoul(text);
  if (value > 65535) {
    return false;
  }
  port = static_cast<std::uint16_t>(value);
  return true;
}

}  // namespace

BrokerHandler::BrokerHandler(IoContextManager &io_context_manager,
                             IBrokerConfigProvider &broker_config_provider,
                             IApiConfigProvider &api_config_provider,
                             api::IManagementApi &api,
                             IConnectorFactory &connector_factory,
                             CliCtx &cli_ctx,
                             customio::ConsoleOutput &output_hub)
    : io_context_manager_(io_context_manager),
      broker_config_provider_(broker_config_provider),
      api_config_provider_(api_config_provider), api_(api),
      connector_factory_(connector_factory), output_hub_(output_hub),
      cli_ctx_(cli_ctx), opt_desc_("broker options") {
  opt_desc_.add_options()                                         //
      ("username,u", po::value<std::string>(),
       "Username for authentication")                             //
      ("password,p", po::value<std::string>(),
       "Password for authentication")                             //
      ("base-url,b", po::value<std::string>(),
       "Management API base URL")                                 //
      ("auth-token", po::value<std::string>(),
       "Token clients must send in X-Qbee-Authorization")         //
      ("listen-port", po::value<std::string>(), "Port to listen on") //
      ("remote-host", po::value<std::string>(),
       "Host to reach on the device side")                        //
      ("remote-port", po::value<std::string>(),
       "Default device port")                                     //
      ("remote-protocol", po::value<std::string>(),
       "Protocol spoken to the device port, http or https");
}

std::string BrokerHandler::print_opt_desc() const {
  std::ostringstream oss;
  oss << "Usage: qbee-cli broker [options]" << std::endl << opt_desc_;
  return oss.str();
}

Error BrokerHandler::ApplyOptions() {
  if (cli_ctx_.vm.count("help")) {
    return make_error(my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc());
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
    return make_error(my_errors::GENERAL::SHOW_OPT_DESC,
                      fmt::format("{}\n{}", ex.what(), print_opt_desc()));
  }
  auto &api_cfg = api_config_provider_.get();
  auto &cfg = broker_config_provider_.get();
  auto take = [&vm](const char *name, std::string &dest) {
    if (vm.count(name)) {
      dest = vm[name].as<std::string>();
    }
  };
  take("username", api_cfg.email);
  take("password", api_cfg.password);
  take("base-url", api_cfg.base_url);
  take("auth-token", cfg.auth_token);
  take("listen-port", cfg.listen_port);
  take("remote-host", cfg.remote_host);
  take("remote-port", cfg.remote_port);
  take("remote-protocol", cfg.remote_protocol);

  if (!api_cfg.has_password_credentials() && api_cfg.access_token.empty()) {
    return make_error(
        my_errors::AUTH::MISSING_CREDENTIALS,
        api_cfg.password.empty() ? "no password provided"
                                 : "no username provided");
  }
  if (cfg.remote_protocol != "http" && cfg.remote_protocol != "https") {
    return make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                      fmt::format("unsupported remote protocol {}",
                                  cfg.remote_protocol));
  }
  std::uint16_t port = 0;
  if (!ParsePort(cfg.remote_port, port)) {
    return make_error(my_errors::TARGET::INVALID_REMOTE_PORT,
                      fmt::format("invalid remote port {}", cfg.remote_port));
  }
  if (!ParsePort(cfg.listen_port, listen_port_)) {
    return make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                      fmt::format("invalid listen port {}", cfg.listen_port));
  }
  return {};
}

void BrokerHandler::start(Completion handler) {
  if (auto err = ApplyOptions()) {
    handler(std::move(err));
    return;
  }
  api_.async_authenticate([self = shared_from_this(),
                           handler = std::move(handler)](Error err) mutable {
    if (err) {
      handler(std::move(err));
      return;
    }
    self->StartService(std::move(handler));
  });
}

void BrokerHandler::StartService(Completion handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_) {
    handler(Error{});
    return;
  }
  const auto &cfg = broker_config_provider_.get();
  auto executor = io_context_manager_.ioc().get_executor();

  cache_ = std::make_unique<broker::ConnectionCache>(
      std::chrono::seconds(cfg.connection_ttl_seconds));
  auth_ = std::make_unique<broker::AuthGate>(
      cfg.auth_token, std::chrono::seconds(cfg.session_cookie_ttl_seconds));
  resolver_ = std::make_unique<DeviceStatusResolver>(executor, api_);

  broker::TunnelProvider::Options tunnel_options;
  tunnel_options.remote_host = cfg.remote_host;
  tunnel_options.port_ready_timeout =
      std::chrono::seconds(cfg.port_ready_timeout_seconds);
  tunnels_ = std::make_shared<broker::TunnelProvider>(
      executor, *cache_, *resolver_, connector_factory_, tunnel_options);

  broker::ReverseProxy::Options proxy_options;
  proxy_options.tls = cfg.remote_protocol == "https";
  proxy_ = std::make_unique<broker::ReverseProxy>(proxy_options);

  broker::BrokerService::Options service_options;
  service_options.listen_port = listen_port_;
  service_options.remote_port = cfg.remote_port;
  service_options.gc_interval = std::chrono::seconds(cfg.gc_interval_seconds);
  service_options.reauth_interval =
      std::chrono::seconds(cfg.reauth_interval_seconds);
  service_ = std::make_shared<broker::BrokerService>(
      executor, api_, *cache_, *auth_, *tunnels_, *proxy_, output_hub_,
      service_options);

  BOOST_LOG_SEV(lg, trivial::info)
      << "starting broker on port " << cfg.listen_port << " for "
      << cfg.remote_protocol << "://" << cfg.remote_host << ':'
      << cfg.remote_port;
  service_->start(std::move(handler));
}

void BrokerHandler::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  stopped_ = true;
  if (service_) {
    service_->stop();
  }
}

}  // namespace qbeecli
