#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "customio/console_output.hpp"
#include "qbee_error.hpp"
#include "transport/transport.hpp"
#include "tunnel/resize_watcher.hpp"
#include "tunnel/splice.hpp"
#include "util/my_logging.hpp"
#include "util/terminal.hpp"

namespace qbeecli {

// Interactive shell (or a single remote command) on a remote PTY.
//
// The local terminal stays in raw mode until the session completes. Input
// and output are copied until either side ends; a clean end of stream
// completes with success. Terminal size changes are forwarded one at a time,
// each on its own pty_command stream acknowledged by the device.
class TerminalSession : public std::enable_shared_from_this<TerminalSession> {
 public:
  TerminalSession(boost::asio::any_io_executor executor,
                  transport::SessionPtr session, ITerminal &terminal,
                  IResizeWatcher &resize_watcher,
                  customio::ConsoleOutput &output);

  // An empty command opens the device's default shell.
  void start(std::string command, std::vector<std::string> command_args,
             Completion handler);
  void stop();

  const std::string &pty_session_id() const { return pty_session_id_; }

 private:
  void DoStart(std::string command, std::vector<std::string> command_args);
  void OnPtyOpened(transport::StreamPtr pty, std::string session_id);
  void OnResize(TerminalSize size);
  void SendResize(TerminalSize size);
  void ResizeDone(Error err);
  void Finish(Error err);

  boost::asio::strand<boost::asio::any_io_executor> strand_;
  transport::SessionPtr session_;
  ITerminal &terminal_;
  IResizeWatcher &resize_watcher_;
  customio::ConsoleOutput &output_;
  Completion handler_;
  std::unique_ptr<TerminalRawMode> raw_mode_;
  std::shared_ptr<Splice> splice_;
  std::string pty_session_id_;
  TerminalSize last_size_;
  std::optional<TerminalSize> queued_size_;
  bool resizing_{false};
  bool resize_failed_{false};
  bool finished_{false};
  src::severity_logger<trivial::severity_level> lg;
};

}  // namespace qbeecli
