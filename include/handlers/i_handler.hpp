#pragma once

#include <functional>
#include <memory>
#include <string>

#include "qbee_error.hpp"

namespace qbeecli {

struct IHandlerFactory {
  virtual ~IHandlerFactory() = default;
  // Throws std::runtime_error for an unknown subcommand.
  virtual std::shared_ptr<class IHandler> create(const std::string &subcmd) = 0;
};

// Minimal common contract for subcommand handlers
struct IHandler {
  virtual ~IHandler() = default;
  // The subcommand name this handler responds to (e.g., "connect", "broker")
  virtual std::string command() const = 0;
  virtual void start(Completion handler) = 0;
  // Interrupt (SIGINT/SIGTERM). The start() handler still runs.
  virtual void stop() = 0;
};

struct HandlerFactoryImpl : public IHandlerFactory {
  using CreatorFunc =
      std::function<std::shared_ptr<IHandler>(const std::string &subcmd)>;
  CreatorFunc creator_;

  explicit HandlerFactoryImpl(CreatorFunc creator)
      : creator_(std::move(creator)) {}

  std::shared_ptr<IHandler> create(const std::string &subcmd) override {
    return creator_(subcmd);
  }
};

}  // namespace qbeecli
