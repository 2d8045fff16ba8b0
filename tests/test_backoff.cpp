#include <gtest/gtest.h>

#include <chrono>
#include <random>

#include "util/backoff.hpp"

namespace qbeecli {
using std::chrono::milliseconds;

TEST(BackoffPolicyTest, CeilingDoublesUntilMax) {
  BackoffPolicy policy{milliseconds(5000), milliseconds(60000)};
  EXPECT_EQ(policy.ceiling_for(1), milliseconds(5000));
  EXPECT_EQ(policy.ceiling_for(2), milliseconds(10000));
  EXPECT_EQ(policy.ceiling_for(3), milliseconds(20000));
  EXPECT_EQ(policy.ceiling_for(4), milliseconds(40000));
  EXPECT_EQ(policy.ceiling_for(5), milliseconds(60000));
  EXPECT_EQ(policy.ceiling_for(50), milliseconds(60000));
}

TEST(BackoffPolicyTest, JitterStaysBelowTwiceTheCeiling) {
  BackoffPolicy policy{milliseconds(100), milliseconds(1000)};
  std::mt19937 rng(42);
  for (int attempt = 1; attempt <= 8; ++attempt) {
    const auto ceiling = policy.ceiling_for(attempt);
    for (int i = 0; i < 100; ++i) {
      const auto delay = policy.delay_for(attempt, rng);
      EXPECT_GE(delay, ceiling);
      EXPECT_LT(delay, ceiling * 2);
    }
  }
}

TEST(BackoffPolicyTest, ZeroBaseNeverWaits) {
  BackoffPolicy policy{milliseconds(0), milliseconds(0)};
  std::mt19937 rng(1);
  EXPECT_EQ(policy.delay_for(3, rng), milliseconds(0));
}

} // namespace qbeecli
