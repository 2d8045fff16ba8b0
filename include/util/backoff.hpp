#pragma once

#include <algorithm>
#include <chrono>
#include <random>

namespace qbeecli {

// Exponential backoff with multiplicative jitter. The n-th failed attempt
// (n >= 1) waits min(base * 2^(n-1), max) plus a uniformly drawn share
// [0, 1) of that value.
struct BackoffPolicy {
  std::chrono::milliseconds base{5000};
  std::chrono::milliseconds max{60000};

  std::chrono::milliseconds ceiling_for(int attempt) const {
    auto delay = base;
    for (int i = 1; i < attempt && delay < max; ++i) {
      delay *= 2;
    }
    return std::min(delay, max);
  }

  template <typename Rng>
  std::chrono::milliseconds delay_for(int attempt, Rng &rng) const {
    const auto ceiling = ceiling_for(attempt);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    const auto jitter = std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(
            static_cast<double>(ceiling.count()) * dist(rng)));
    return ceiling + jitter;
  }
};

}  // namespace qbeecli
