#pragma once

#include <array>
#include <functional>
#include <memory>
#include <mutex>

#include "transport/transport.hpp"

namespace qbeecli {

// Copies bytes both ways between two streams. The first direction to end
// closes both streams and completes the splice: end of stream completes
// with a clear code, anything else with that error.
class Splice : public std::enable_shared_from_this<Splice> {
 public:
  using Handler = std::function<void(boost::system::error_code)>;

  static std::shared_ptr<Splice> Start(transport::StreamPtr a,
                                       transport::StreamPtr b,
                                       Handler handler);

  // Closes both streams; completes with operation_aborted unless a
  // direction already ended.
  void close();

  Splice(transport::StreamPtr a, transport::StreamPtr b, Handler handler)
      : a_(std::move(a)), b_(std::move(b)), handler_(std::move(handler)) {}

 private:
  static constexpr std::size_t kBufferSize = 16 * 1024;

  struct Direction {
    transport::IStream *from;
    transport::IStream *to;
    std::array<char, kBufferSize> buffer;
  };

  void Pump(Direction &dir);
  void Finish(boost::system::error_code ec);

  transport::StreamPtr a_;
  transport::StreamPtr b_;
  Handler handler_;
  Direction a_to_b_{};
  Direction b_to_a_{};
  std::mutex mutex_;
  bool finished_{false};
};

}  // namespace qbeecli
