#pragma once

#include <boost/asio/signal_set.hpp>

#include <functional>
#include <memory>

#include "util/io_context_manager.hpp"
#include "util/terminal.hpp"

namespace qbeecli {

// Reports local terminal size changes until stopped.
class IResizeWatcher {
 public:
  using Handler = std::function<void(TerminalSize)>;

  virtual ~IResizeWatcher() = default;
  virtual void watch(Handler on_resize) = 0;
  virtual void stop() = 0;
};

// SIGWINCH through an asio signal_set.
class SignalResizeWatcher : public IResizeWatcher {
 public:
  SignalResizeWatcher(IoContextManager &io_context_manager,
                      ITerminal &terminal);
  ~SignalResizeWatcher() override;

  void watch(Handler on_resize) override;
  void stop() override;

 private:
  struct State;
  std::shared_ptr<State> state_;
};

// For platforms without a resize signal.
class NoopResizeWatcher : public IResizeWatcher {
 public:
  void watch(Handler) override {}
  void stop() override {}
};

}  // namespace qbeecli
