#pragma once

#include <boost/program_options.hpp>

#include <memory>
#include <mutex>
#include <string>

#include "api/management_api.hpp"
#include "broker/auth_gate.hpp"
#include "broker/broker_service.hpp"
#include "broker/connection_cache.hpp"
#include "broker/reverse_proxy.hpp"
#include "broker/tunnel_provider.hpp"
#include "conf/api_config.hpp"
#include "conf/broker_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "qbeecli_common.hpp"
#include "tunnel/device_connector.hpp"
#include "tunnel/device_status_resolver.hpp"
#include "util/io_context_manager.hpp"
#include "util/my_logging.hpp"

namespace qbeecli {

// `broker`: HTTP reverse proxy that reaches device web services through
// on-demand tunnels.
class BrokerHandler : public IHandler,
                      public std::enable_shared_from_this<BrokerHandler> {
  IoContextManager &io_context_manager_;
  IBrokerConfigProvider &broker_config_provider_;
  IApiConfigProvider &api_config_provider_;
  api::IManagementApi &api_;
  IConnectorFactory &connector_factory_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;
  po::options_description opt_desc_;
  src::severity_logger<trivial::severity_level> lg;

  std::unique_ptr<broker::ConnectionCache> cache_;
  std::unique_ptr<broker::AuthGate> auth_;
  std::unique_ptr<DeviceStatusResolver> resolver_;
  std::shared_ptr<broker::TunnelProvider> tunnels_;
  std::unique_ptr<broker::ReverseProxy> proxy_;
  std::mutex mutex_;
  std::shared_ptr<broker::BrokerService> service_;
  std::uint16_t listen_port_{0};
  bool stopped_{false};

 public:
  BrokerHandler(IoContextManager &io_context_manager,
                IBrokerConfigProvider &broker_config_provider,
                IApiConfigProvider &api_config_provider,
                api::IManagementApi &api, IConnectorFactory &connector_factory,
                CliCtx &cli_ctx, customio::ConsoleOutput &output_hub);

  std::string command() const override { return "broker"; }

  std::string print_opt_desc() const;

  void start(Completion handler) override;
  void stop() override;

 private:
  // Applies the command line on top of the file and environment config.
  Error ApplyOptions();
  void StartService(Completion handler);
};

}  // namespace qbeecli
