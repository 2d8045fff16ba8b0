#pragma once

#include <boost/asio/post.hpp>

namespace qbeecli {

// Wraps a completion handler so that it runs on the given executor
// (usually a strand) instead of wherever the operation completed.
template <typename Executor, typename Fn>
auto PostTo(const Executor &executor, Fn fn) {
  return [executor, fn](auto... args) {
    boost::asio::post(executor, [fn, args...]() mutable { fn(args...); });
  };
}

}  // namespace qbeecli
