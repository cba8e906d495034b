#include "Utils.hpp"
#include <gtest/gtest.h>

TEST(UtilsTest, HuberLossIsWeighted) {
  auto y = torch::zeros({2});
  auto t = torch::tensor({0.5f, 3.0f});
  auto weights = torch::tensor({1.0f, 2.0f});

  auto sum = weightedValueLoss(y, t, weights, true, BatchAccumulator::Sum);
  EXPECT_NEAR(sum.item<float>(), 0.125f + 2 * 2.5f, 1e-6);

  auto mean = weightedValueLoss(y, t, weights, true, BatchAccumulator::Mean);
  EXPECT_NEAR(mean.item<float>(), (0.125f + 2 * 2.5f) / 2, 1e-6);
}

TEST(UtilsTest, SquaredLossWithoutClipping) {
  auto y = torch::zeros({2});
  auto t = torch::tensor({0.5f, 3.0f});
  auto weights = torch::tensor({1.0f, 2.0f});

  auto sum = weightedValueLoss(y, t, weights, false, BatchAccumulator::Sum);
  EXPECT_NEAR(sum.item<float>(), 0.125f + 2 * 4.5f, 1e-6);
}

TEST(UtilsTest, SupervisedMarginLoss) {
  auto q = torch::tensor({{1.0f, 2.0f}, {0.0f, 0.0f}});
  auto expert = torch::tensor({0, 1}, torch::kLong);

  auto sum = supervisedMarginLoss(q, expert, 0.8, BatchAccumulator::Sum);
  EXPECT_NEAR(sum.item<float>(), 1.8f + 0.8f, 1e-6);

  auto mean = supervisedMarginLoss(q, expert, 0.8, BatchAccumulator::Mean);
  EXPECT_NEAR(mean.item<float>(), 1.3f, 1e-6);
}

TEST(UtilsTest, SupervisedMarginLossIsZeroWhenExpertIsClearlyBest) {
  auto q = torch::tensor({{5.0f, 1.0f, 0.0f}});
  auto expert = torch::tensor({0}, torch::kLong);
  auto loss = supervisedMarginLoss(q, expert, 0.8, BatchAccumulator::Mean);
  EXPECT_FLOAT_EQ(loss.item<float>(), 0.0f);
}

TEST(UtilsTest, SupervisedMarginLossOnEmptyDemoPart) {
  auto q = torch::zeros({0, 3});
  auto expert = torch::zeros({0}, torch::kLong);
  auto loss = supervisedMarginLoss(q, expert, 0.8, BatchAccumulator::Mean);
  EXPECT_FLOAT_EQ(loss.item<float>(), 0.0f);
}

TEST(UtilsTest, SupervisedMarginLossGradientFlowsToQ) {
  auto q = torch::tensor({{1.0f, 2.0f}}).requires_grad_(true);
  auto expert = torch::tensor({0}, torch::kLong);
  supervisedMarginLoss(q, expert, 0.8, BatchAccumulator::Sum).backward();
  auto grad = q.grad();
  EXPECT_FLOAT_EQ(grad[0][0].item<float>(), -1.0f);
  EXPECT_FLOAT_EQ(grad[0][1].item<float>(), 1.0f);
}

TEST(UtilsTest, DoubleDQNTargetUsesOnlineArgmax) {
  ActionValue nextOnline(torch::tensor({{1.0f, 5.0f}, {3.0f, 0.0f}}));
  ActionValue nextTarget(torch::tensor({{10.0f, 20.0f}, {30.0f, 40.0f}}));
  auto reward = torch::ones({2});
  auto discount = torch::full({2}, 0.5f);
  auto terminal = torch::tensor({0.0f, 1.0f});

  auto target =
      doubleDQNTarget(reward, discount, terminal, nextOnline, nextTarget);
  EXPECT_FLOAT_EQ(target[0].item<float>(), 11.0f);
  EXPECT_FLOAT_EQ(target[1].item<float>(), 1.0f);
}

TEST(UtilsTest, DecayedAverage) {
  EXPECT_DOUBLE_EQ(decayedAverage(1.0, 3.0, 0.5), 2.0);
  EXPECT_DOUBLE_EQ(decayedAverage(1.0, 3.0, 1.0), 1.0);
}

TEST(UtilsTest, ToVector) {
  auto values = toVector(torch::tensor({1.5f, -2.0f}));
  EXPECT_EQ(values, std::vector<double>({1.5, -2.0}));
}
