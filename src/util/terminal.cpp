#include "util/terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <boost/system/system_error.hpp>

#include <cerrno>
#include <iostream>

#include "transport/local_stream.hpp"
#include "util/my_logging.hpp"

namespace qbeecli {

namespace {

[[noreturn]] void ThrowErrno(const char *what) {
  throw boost::system::system_error(
      boost::system::error_code(errno, boost::system::system_category()), what);
}

}  // namespace

void PosixTerminal::make_raw() {
  termios current{};
  if (::tcgetattr(STDIN_FILENO, &current) != 0) {
    ThrowErrno("tcgetattr");
  }
  termios raw = current;
  ::cfmakeraw(&raw);
  if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) {
    ThrowErrno("tcsetattr");
  }
  saved_ = current;
}

void PosixTerminal::restore() {
  if (!saved_) {
    return;
  }
  if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &*saved_) != 0) {
    ThrowErrno("tcsetattr");
  }
  saved_.reset();
}

TerminalSize PosixTerminal::size() {
  winsize ws{};
  if (::ioctl(STDIN_FILENO, TIOCGWINSZ, &ws) != 0) {
    ThrowErrno("TIOCGWINSZ");
  }
  return TerminalSize{ws.ws_col, ws.ws_row};
}

transport::StreamPtr
PosixTerminal::open_io(boost::asio::any_io_executor executor) {
  return std::make_shared<transport::DescriptorStream>(
      std::move(executor), STDIN_FILENO, STDOUT_FILENO);
}

TerminalRawMode::~TerminalRawMode() {
  try {
    terminal_.restore();
  } catch (const boost::system::system_error &ex) {
    std::cerr << "error restoring terminal state: " << ex.what() << std::endl;
    src::severity_logger<trivial::severity_level> lg;
    BOOST_LOG_SEV(lg, trivial::error)
        << "error restoring terminal state: " << ex.what();
  }
}

}  // namespace qbeecli
