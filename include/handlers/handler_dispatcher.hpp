#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "handlers/i_handler.hpp"
#include "qbee_error.hpp"
#include "util/my_logging.hpp"

namespace qbeecli {

// Lifetime: created by the injector inside App::start and kept for the whole
// CLI session. Holds the running handler so a signal can stop it.
class HandlerDispatcher {
  IHandlerFactory &handler_factory_;
  std::shared_ptr<IHandler> running_;
  src::severity_logger<trivial::severity_level> lg;

 public:
  explicit HandlerDispatcher(IHandlerFactory &handler_factory)
      : handler_factory_(handler_factory) {}

  // False when no handler serves the subcommand.
  bool dispatch_run(const std::string &subcmd, Completion cont) {
    try {
      running_ = handler_factory_.create(subcmd);
    } catch (const std::runtime_error &ex) {
      BOOST_LOG_SEV(lg, trivial::debug) << ex.what();
      return false;
    }
    running_->start(std::move(cont));
    return true;
  }

  void stop() {
    if (running_) {
      running_->stop();
    }
  }
};

}  // namespace qbeecli
