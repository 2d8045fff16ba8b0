#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <unistd.h>

// ANSI colour codes for console messages. Codes collapse to "" when the
// target stream is not a terminal (or TERM is dumb), so callers can always
// splice them into the output.
namespace customio {

class ColorPrinter {
 public:
  ColorPrinter() : enable_colors_(detect_tty_for_stream(std::cerr)) {}

  explicit ColorPrinter(std::ostream &os)
      : enable_colors_(detect_tty_for_stream(os)) {}

  ColorPrinter(std::ostream &, bool enable_colors)
      : enable_colors_(enable_colors) {}

  void set_enabled(bool enabled) { enable_colors_ = enabled; }
  bool enabled() const { return enable_colors_; }

  const char *reset() const { return enable_colors_ ? "\033[0m" : ""; }
  const char *dim() const { return enable_colors_ ? "\033[2m" : ""; }
  const char *red() const { return enable_colors_ ? "\033[31m" : ""; }
  const char *green() const { return enable_colors_ ? "\033[32m" : ""; }
  const char *yellow() const { return enable_colors_ ? "\033[33m" : ""; }

 private:
  bool enable_colors_;

  static bool detect_tty_for_stream(std::ostream &os) {
    bool is_tty = false;
    if (&os == &std::cout) {
      is_tty = ::isatty(fileno(stdout));
    } else if (&os == &std::cerr) {
      is_tty = ::isatty(fileno(stderr));
    }
    const char *term = std::getenv("TERM");
    bool term_ok = term && std::strcmp(term, "dumb") != 0;
    return is_tty && term_ok;
  }
};

} // namespace customio
