#pragma once

#include <boost/asio/any_io_executor.hpp>

#include <termios.h>

#include <cstdint>
#include <optional>

#include "transport/transport.hpp"

namespace qbeecli {

struct TerminalSize {
  std::uint16_t cols{0};
  std::uint16_t rows{0};

  friend bool operator==(const TerminalSize &, const TerminalSize &) = default;
};

// The local controlling terminal. Methods throw boost::system::system_error.
class ITerminal {
 public:
  virtual ~ITerminal() = default;

  virtual void make_raw() = 0;
  virtual void restore() = 0;
  virtual TerminalSize size() = 0;
  // Reads keyboard input and writes remote output.
  virtual transport::StreamPtr open_io(boost::asio::any_io_executor executor) = 0;
};

// Terminal on stdin/stdout.
class PosixTerminal : public ITerminal {
 public:
  void make_raw() override;
  void restore() override;
  TerminalSize size() override;
  transport::StreamPtr open_io(boost::asio::any_io_executor executor) override;

 private:
  std::optional<termios> saved_;
};

// Keeps the terminal in raw mode for the lifetime of the guard.
class TerminalRawMode {
 public:
  explicit TerminalRawMode(ITerminal &terminal) : terminal_(terminal) {
    terminal_.make_raw();
  }
  ~TerminalRawMode();

  TerminalRawMode(const TerminalRawMode &) = delete;
  TerminalRawMode &operator=(const TerminalRawMode &) = delete;

 private:
  ITerminal &terminal_;
};

}  // namespace qbeecli
