#include "Errors.hpp"
#include "Explorer.hpp"
#include <gtest/gtest.h>
#include <set>

TEST(ExplorerTest, GreedyReturnsGreedyAction) {
  Greedy explorer;
  EXPECT_EQ(explorer.selectAction(0, [] { return int64_t(3); }), 3);
}

TEST(ExplorerTest, ZeroEpsilonIsGreedy) {
  ConstantEpsilonGreedy explorer(0.0, 4, 1);
  for (int64_t t = 0; t < 100; t++) {
    EXPECT_EQ(explorer.selectAction(t, [] { return int64_t(2); }), 2);
  }
}

TEST(ExplorerTest, FullEpsilonCoversEveryAction) {
  ConstantEpsilonGreedy explorer(1.0, 4, 1);
  std::set<int64_t> seen;
  auto greedyCalls = 0;
  for (int64_t t = 0; t < 200; t++) {
    auto action = explorer.selectAction(t, [&greedyCalls] {
      greedyCalls++;
      return int64_t(0);
    });
    EXPECT_GE(action, 0);
    EXPECT_LT(action, 4);
    seen.insert(action);
  }
  EXPECT_EQ(seen.size(), 4u);
  EXPECT_EQ(greedyCalls, 0);
}

TEST(ExplorerTest, LinearDecay) {
  LinearDecayEpsilonGreedy explorer(1.0, 0.1, 10, 2, 1);
  EXPECT_DOUBLE_EQ(explorer.computeEpsilon(0), 1.0);
  EXPECT_NEAR(explorer.computeEpsilon(5), 0.55, 1e-12);
  EXPECT_DOUBLE_EQ(explorer.computeEpsilon(10), 0.1);
  EXPECT_DOUBLE_EQ(explorer.computeEpsilon(1000), 0.1);
}

TEST(ExplorerTest, RejectsBadArguments) {
  EXPECT_THROW(ConstantEpsilonGreedy(1.5, 2), ConfigurationError);
  EXPECT_THROW(ConstantEpsilonGreedy(0.1, 0), ConfigurationError);
  EXPECT_THROW(LinearDecayEpsilonGreedy(1.0, -0.1, 10, 2), ConfigurationError);
  EXPECT_THROW(LinearDecayEpsilonGreedy(1.0, 0.1, -1, 2), ConfigurationError);
}
