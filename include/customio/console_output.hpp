#pragma once

#include <cstddef>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include "customio/color_printer.hpp"

namespace customio {

// User-facing console messages. Everything goes to stderr so that stdout
// stays free for stdio tunnels and terminal sessions. One line is written
// atomically, even when several devices report at the same time.
class ConsoleOutput {
 public:
  enum Level : std::size_t { kError = 1, kWarning = 2, kInfo = 3, kDebug = 4, kTrace = 5 };

  class Line {
   public:
    Line(ConsoleOutput *owner, const char *color) : owner_(owner), color_(color) {}
    Line(Line &&other) noexcept
        : owner_(other.owner_), color_(other.color_), buf_(std::move(other.buf_)) {
      other.owner_ = nullptr;
    }
    Line(const Line &) = delete;
    Line &operator=(const Line &) = delete;
    ~Line() {
      if (owner_) {
        owner_->write_line(color_, buf_.str());
      }
    }

    template <typename T>
    Line &operator<<(const T &v) {
      if (owner_) {
        buf_ << v;
      }
      return *this;
    }
    using Manip = std::ostream &(*)(std::ostream &);
    Line &operator<<(Manip m) {
      if (owner_) {
        m(buf_);
      }
      return *this;
    }

   private:
    ConsoleOutput *owner_;
    const char *color_;
    std::ostringstream buf_;
  };

  explicit ConsoleOutput(std::size_t verbosity = kInfo)
      : verbosity_(verbosity), printer_(std::cerr), stream_(&std::cerr) {}

  ConsoleOutput(std::size_t verbosity, std::ostream &os)
      : verbosity_(verbosity), printer_(os, false), stream_(&os) {}

  Line error() { return make_line(kError, printer_.red()); }
  Line warning() { return make_line(kWarning, printer_.yellow()); }
  Line info() { return make_line(kInfo, ""); }
  Line debug() { return make_line(kDebug, printer_.dim()); }
  Line trace() { return make_line(kTrace, printer_.dim()); }

  std::size_t verbosity() const { return verbosity_; }
  void set_verbosity(std::size_t v) { verbosity_ = v; }

 private:
  Line make_line(std::size_t level, const char *color) {
    return Line(level <= verbosity_ ? this : nullptr, color);
  }

  void write_line(const char *color, std::string text) {
    while (!text.empty() && text.back() == '\n') {
      text.pop_back();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    *stream_ << color << text << printer_.reset() << '\n';
    stream_->flush();
  }

  std::size_t verbosity_;
  ColorPrinter printer_;
  std::ostream *stream_;
  std::mutex mutex_;
};

} // namespace customio
