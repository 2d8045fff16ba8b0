#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "util/my_logging.hpp"

namespace qbeecli {

// One io_context driven by a fixed pool of worker threads. The work guard
// keeps the threads alive while handlers are idle; stop() releases it,
// stops the context and joins the pool.
class IoContextManager {
 public:
  explicit IoContextManager(int threads)
      : ioc_(std::max(1, threads)),
        work_guard_(boost::asio::make_work_guard(ioc_)) {
    const int n = std::max(1, threads);
    threads_.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
      threads_.emplace_back([this, i]() {
        BOOST_LOG_SEV(lg, trivial::trace) << "io worker " << i << " started";
        ioc_.run();
        BOOST_LOG_SEV(lg, trivial::trace) << "io worker " << i << " exited";
      });
    }
  }

  ~IoContextManager() { stop(); }

  IoContextManager(const IoContextManager &) = delete;
  IoContextManager &operator=(const IoContextManager &) = delete;

  boost::asio::io_context &ioc() { return ioc_; }

  void stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (stopped_) {
      return;
    }
    stopped_ = true;
    work_guard_.reset();
    ioc_.stop();
    for (auto &t : threads_) {
      if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
        t.join();
      } else if (t.joinable()) {
        t.detach();
      }
    }
  }

 private:
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_guard_;
  std::vector<std::thread> threads_;
  std::mutex stop_mutex_;
  bool stopped_{false};
  src::severity_logger<trivial::severity_level> lg;
};

}  // namespace qbeecli
