#include "Errors.hpp"
#include "ExperienceCodec.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>

TEST(ExperienceCodecTest, KeepsOptionalFieldsAndExtras) {
  std::vector<RawTransition> transitions;
  transitions.push_back(makeTransition(3));
  RawTransition last(torch::arange(6, torch::kUInt8).view({2, 3}), 2, -0.5f,
                     std::nullopt, std::nullopt, true);
  last.extras["behaviour_prob"] = 0.25;
  transitions.push_back(last);
  Experience experience(transitions);

  ExperienceCodec codec;
  auto restored = codec.decompress(codec.compress(experience));

  ASSERT_EQ(restored.size(), 2u);
  const auto &first = restored.front();
  EXPECT_TRUE(torch::equal(first.state, torch::full({2}, 3.0f)));
  ASSERT_TRUE(first.nextState.has_value());
  EXPECT_TRUE(torch::equal(*first.nextState, torch::full({2}, 4.0f)));
  ASSERT_TRUE(first.nextAction.has_value());
  EXPECT_FALSE(first.isStateTerminal);

  const auto &second = restored.back();
  EXPECT_EQ(second.state.scalar_type(), torch::kUInt8);
  EXPECT_EQ(second.state.sizes().vec(), std::vector<int64_t>({2, 3}));
  EXPECT_TRUE(torch::equal(second.state, last.state));
  EXPECT_EQ(second.action, 2);
  EXPECT_FLOAT_EQ(second.reward, -0.5f);
  EXPECT_FALSE(second.nextState.has_value());
  EXPECT_FALSE(second.nextAction.has_value());
  EXPECT_TRUE(second.isStateTerminal);
  EXPECT_DOUBLE_EQ(second.extras.at("behaviour_prob"), 0.25);
}

TEST(ExperienceCodecTest, RejectsGarbage) {
  ExperienceCodec codec;
  StoredData data;
  data.size = 4;
  data.ptr = std::make_unique<char[]>(4);
  EXPECT_THROW(codec.decompress(data), CodecError);

  EXPECT_THROW(codec.decompress(StoredData()), CodecError);
}

TEST(ExperienceCodecTest, RejectsTruncatedRecord) {
  ExperienceCodec codec;
  auto bytes = codec.encode(makeExperience(0, 2));
  bytes.resize(bytes.size() - 3);
  EXPECT_THROW(codec.decode(bytes), CodecError);
}
