#include "tunnel/resize_watcher.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <csignal>

#include "util/my_logging.hpp"

namespace qbeecli {
namespace net = boost::asio;

// Pending waits hold the state, not the watcher, so the watcher may go away
// while a wait is still queued.
struct SignalResizeWatcher::State
    : std::enable_shared_from_this<SignalResizeWatcher::State> {
  State(net::io_context &ioc, ITerminal &terminal)
      : strand(net::make_strand(ioc)), signals(strand), terminal(terminal) {}

  void Wait() {
    signals.async_wait([self = shared_from_this()](boost::system::error_code ec,
                                                   int) {
      if (ec || self->stopped) {
        return;
      }
      try {
        const auto size = self->terminal.size();
        if (self->handler) {
          self->handler(size);
        }
      } catch (const boost::system::system_error &ex) {
        BOOST_LOG_SEV(self->lg, trivial::warning)
            << "terminal get size: " << ex.what();
      }
      self->Wait();
    });
  }

  net::strand<net::io_context::executor_type> strand;
  net::signal_set signals;
  ITerminal &terminal;
  Handler handler;
  bool stopped{false};
  src::severity_logger<trivial::severity_level> lg;
};

SignalResizeWatcher::SignalResizeWatcher(IoContextManager &io_context_manager,
                                         ITerminal &terminal)
    : state_(std::make_shared<State>(io_context_manager.ioc(), terminal)) {}

SignalResizeWatcher::~SignalResizeWatcher() { stop(); }

void SignalResizeWatcher::watch(Handler on_resize) {
  net::post(state_->strand, [state = state_,
                             on_resize = std::move(on_resize)]() mutable {
    boost::system::error_code ec;
    state->stopped = false;
    state->handler = std::move(on_resize);
    state->signals.add(SIGWINCH, ec);
    if (ec) {
      BOOST_LOG_SEV(state->lg, trivial::warning)
          << "cannot watch SIGWINCH: " << ec.message();
      return;
    }
    state->Wait();
  });
}

void SignalResizeWatcher::stop() {
  net::post(state_->strand, [state = state_]() {
    state->stopped = true;
    state->handler = nullptr;
    boost::system::error_code ignored;
    state->signals.clear(ignored);
    state->signals.cancel(ignored);
  });
}

}  // namespace qbeecli
