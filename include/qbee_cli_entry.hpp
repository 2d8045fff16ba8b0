#pragma once

#include <boost/asio/signal_set.hpp>

#include <algorithm>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "api/management_api.hpp"
#include "boost/di.hpp"
#include "conf/api_config.hpp"
#include "conf/broker_config.hpp"
#include "conf/config_sources.hpp"
#include "conf/connect_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/broker_handler.hpp"
#include "handlers/connect_handler.hpp"
#include "handlers/handler_dispatcher.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/terminal_handler.hpp"
#include "my_error_codes.hpp"
#include "qbeecli_common.hpp"
#include "transport/ws_transport_client.hpp"
#include "tunnel/device_connector.hpp"
#include "tunnel/resize_watcher.hpp"
#include "util/io_context_manager.hpp"
#include "util/terminal.hpp"

namespace di = boost::di;
namespace qbeecli {

namespace type_tags {

template <typename Tag> struct AppTypeTraits;

struct PosixTag {};

template <> struct AppTypeTraits<PosixTag> {
#ifdef SIGWINCH
  using ResizeWatcher = SignalResizeWatcher;
#else
  using ResizeWatcher = NoopResizeWatcher;
#endif
};
}  // namespace type_tags

namespace detail {

// Parks the main thread until the handler finishes or a signal arrives.
class Blocker {
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_{false};

 public:
  void wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return stopped_; });
  }
  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
  }
};

}  // namespace detail

template <typename AppTag>
class App : public std::enable_shared_from_this<App<AppTag>> {
  detail::Blocker blocker_;
  ConfigSources &config_sources_;
  CliCtx &cli_ctx_;
  customio::ConsoleOutput *output_hub_{nullptr};
  IoContextManager *io_context_manager_{nullptr};
  HandlerDispatcher *dispatcher_{nullptr};
  std::unique_ptr<boost::asio::signal_set> signals_;
  std::once_flag shutdown_once_flag_;
  std::mutex result_mutex_;
  Error result_;
  src::severity_logger<trivial::severity_level> lg;

 public:
  App(ConfigSources &config_sources, CliCtx &cli_ctx)
      : config_sources_(config_sources), cli_ctx_(cli_ctx) {}

  void print_error(const Error &err) {
    if (err.is(my_errors::GENERAL::SHOW_OPT_DESC)) {
      std::cerr << err.what << std::endl;
    } else {
      output_hub_->error() << "Error: " << err.what;
    }
  }

  // Exit status of the run.
  int start() {
    static customio::ConsoleOutput output_hub(cli_ctx_.verbosity_level());
    using Traits = type_tags::AppTypeTraits<AppTag>;

    auto handler_module = []() {
      return di::make_injector(
          di::bind<ConnectHandler>().in(di::unique),
          di::bind<TerminalHandler>().in(di::unique),
          di::bind<BrokerHandler>().in(di::unique),
          di::bind<IHandlerFactory>().to(
              [](const auto &inj) -> IHandlerFactory & {
                static HandlerFactoryImpl factory(
                    [&inj](const std::string &subcmd)
                        -> std::shared_ptr<IHandler> {
                      if (subcmd == "connect") {
                        return inj.template create<
                            std::shared_ptr<ConnectHandler>>();
                      } else if (subcmd == "term" || subcmd == "shell") {
                        return inj.template create<
                            std::shared_ptr<TerminalHandler>>();
                      } else if (subcmd == "broker") {
                        return inj.template create<
                            std::shared_ptr<BrokerHandler>>();
                      } else {
                        throw std::runtime_error("Unsupported subcommand: " +
                                                 subcmd);
                      }
                    });
                return factory;
              }));
    };

    auto injector = di::make_injector(
        handler_module(), di::bind<ConfigSources>().to(config_sources_),
        di::bind<CliCtx>().to(cli_ctx_),
        di::bind<customio::ConsoleOutput>().to(output_hub),
        di::bind<IApiConfigProvider>().to<ApiConfigProviderFile>(),
        di::bind<IConnectConfigProvider>().to<ConnectConfigProviderFile>(),
        di::bind<IBrokerConfigProvider>().to<BrokerConfigProviderFile>(),
        di::bind<IoContextManager>().to(
            [](const auto &inj) -> IoContextManager & {
              static IoContextManager manager(std::max(
                  inj.template create<IConnectConfigProvider &>()
                      .get()
                      .io_threads,
                  inj.template create<IBrokerConfigProvider &>()
                      .get()
                      .io_threads));
              return manager;
            }),
        di::bind<api::IManagementApi>().to<api::HttpManagementApi>(),
        di::bind<transport::ITransportClient>()
            .to<transport::WsTransportClient>(),
        di::bind<ITerminal>().to<PosixTerminal>(),
        di::bind<IResizeWatcher>().to<typename Traits::ResizeWatcher>(),
        di::bind<IConnectorFactory>().to<DeviceConnectorFactory>());

    io_context_manager_ = &injector.template create<IoContextManager &>();
    output_hub_ = &injector.template create<customio::ConsoleOutput &>();
    auto self = this->shared_from_this();

    output_hub_->debug() << "Config source directories:";
    for (const auto &source : config_sources_.paths()) {
      output_hub_->debug() << " - " << source.string();
    }

    auto &dispatcher = injector.template create<HandlerDispatcher &>();
    dispatcher_ = &dispatcher;

    signals_ = std::make_unique<boost::asio::signal_set>(
        io_context_manager_->ioc(), SIGINT, SIGTERM);
    signals_->async_wait(
        [self](const boost::system::error_code &error, int signal) {
          if (error) {
            return;
          }
          const char *signal_name = (signal == SIGINT) ? "SIGINT" : "SIGTERM";
          BOOST_LOG_SEV(self->lg, trivial::info)
              << signal_name << " received, stopping";
          self->dispatcher_->stop();
        });

    bool dispatched =
        dispatcher.dispatch_run(cli_ctx_.params.subcmd, [self](Error err) {
          if (err) {
            self->print_error(err);
          } else {
            self->output_hub_->debug() << "Handler completed successfully.";
          }
          {
            std::lock_guard<std::mutex> lock(self->result_mutex_);
            self->result_ = std::move(err);
          }
          self->blocker_.stop();
        });

    if (!dispatched) {
      output_hub_->error() << "No valid subcommand provided. Available: "
                           << "connect, term, shell, broker.";
      shutdown();
      return EXIT_FAILURE;
    }

    blocker_.wait();
    shutdown();
    std::lock_guard<std::mutex> lock(result_mutex_);
    return result_ ? EXIT_FAILURE : EXIT_SUCCESS;
  }

  void shutdown() {
    auto self = this->shared_from_this();
    std::call_once(shutdown_once_flag_, [self] {
      self->output_hub_->trace() << "Shutting down App...";
      if (self->signals_) {
        boost::system::error_code ec;
        self->signals_->cancel(ec);
        self->signals_.reset();
      }
      self->io_context_manager_->stop();
      self->output_hub_->trace() << "App shutdown completed.";
    });
  }
};

template <typename AppTag>
int launch(ConfigSources &config, CliCtx &ctx) {
  auto app = std::make_shared<App<AppTag>>(config, ctx);
  return app->start();
}

}  // namespace qbeecli
