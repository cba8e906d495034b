#include "BatchAssembler.hpp"
#include "DualReplayBuffer.hpp"
#include "TestHelpers.hpp"
#include <cmath>
#include <gtest/gtest.h>

TEST(BatchAssemblerTest, NStepRewardAndDiscount) {
  const double gamma = 0.9;
  BatchAssembler assembler(gamma);

  std::vector<Experience> experiences = {makeExperience(0, 3),
                                         makeExperience(10, 1),
                                         makeExperience(20, 2, true)};
  experiences[0].transitions[1].reward = 2.0f;
  experiences[0].weight = 0.5f;

  auto batch = assembler.toBatchedTrainData(experiences);
  ASSERT_EQ(batch.size(), 3);

  EXPECT_FLOAT_EQ(batch.rewardNStep[0].item<float>(), 1.0f + 0.9f * 2.0f + 0.81f);
  EXPECT_FLOAT_EQ(batch.rewardNStep[1].item<float>(), 1.0f);
  EXPECT_FLOAT_EQ(batch.rewardNStep[2].item<float>(), 1.9f);

  for (int64_t i = 0; i < batch.size(); i++) {
    auto length = experiences[i].size();
    EXPECT_FLOAT_EQ(batch.discount[i].item<float>(),
                    static_cast<float>(std::pow(gamma, length)));
    EXPECT_FLOAT_EQ(batch.reward1Step[i].item<float>(),
                    experiences[i].front().reward);
  }

  EXPECT_FLOAT_EQ(batch.weights[0].item<float>(), 0.5f);
  EXPECT_FLOAT_EQ(batch.isStateTerminal[2].item<float>(), 1.0f);
  EXPECT_FLOAT_EQ(batch.isStateTerminal[0].item<float>(), 0.0f);
}

TEST(BatchAssemblerTest, StatesComeFromFirstAndLastTransition) {
  BatchAssembler assembler(0.99);
  auto batch = assembler.toBatchedTrainData({makeExperience(4, 3)});

  EXPECT_TRUE(torch::equal(batch.state[0], torch::full({2}, 4.0f)));
  EXPECT_TRUE(torch::equal(batch.nextState1Step[0], torch::full({2}, 5.0f)));
  EXPECT_TRUE(torch::equal(batch.nextStateNStep[0], torch::full({2}, 7.0f)));
  ASSERT_TRUE(batch.nextAction.has_value());
}

TEST(BatchAssemblerTest, NextActionOnlyWhenEveryExperienceHasOne) {
  BatchAssembler assembler(0.99);
  auto experience = makeExperience(0, 1);
  experience.transitions[0].nextAction.reset();

  auto batch = assembler.toBatchedTrainData({makeExperience(5, 1), experience});
  EXPECT_FALSE(batch.nextAction.has_value());
}

TEST(BatchAssemblerTest, MissingNextStateBecomesZeros) {
  BatchAssembler assembler(0.99);
  RawTransition terminal(torch::ones({2}), 1, 1.0f, std::nullopt, std::nullopt,
                         true);
  auto batch = assembler.toBatchedTrainData(
      {Experience(std::vector<RawTransition>{terminal})});
  EXPECT_TRUE(torch::equal(batch.nextStateNStep[0], torch::zeros({2})));
}

TEST(BatchAssemblerTest, AppliesPhi) {
  BatchAssembler assembler(0.99, [](const torch::Tensor &x) { return x * 2; });
  auto batch = assembler.toBatchedTrainData({makeExperience(1, 1)});
  EXPECT_TRUE(torch::equal(batch.state[0], torch::full({2}, 2.0f)));
  EXPECT_TRUE(torch::equal(batch.nextState1Step[0], torch::full({2}, 4.0f)));
}

TEST(BatchAssemblerTest, EmptyInputThrows) {
  BatchAssembler assembler(0.99);
  EXPECT_THROW(assembler.toBatchedTrainData({}), std::invalid_argument);
}

TEST(BatchAssemblerTest, SingleStepExperienceThroughBuffer) {
  DualReplayBuffer buffer(quietReplayConfig(10, 1));
  buffer.append(makeTransition(3, false, 0.75f));

  auto sampled = buffer.sample(1);
  ASSERT_EQ(sampled.agent.size(), 1u);

  BatchAssembler assembler(0.99);
  auto batch = assembler.toBatchedTrainData(sampled.agent);
  EXPECT_FLOAT_EQ(batch.reward1Step[0].item<float>(),
                  batch.rewardNStep[0].item<float>());
  EXPECT_TRUE(torch::equal(batch.nextState1Step, batch.nextStateNStep));
  EXPECT_FLOAT_EQ(batch.discount[0].item<float>(), 0.99f);
}
