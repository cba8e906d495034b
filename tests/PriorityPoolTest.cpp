#include "Errors.hpp"
#include "PriorityPool.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>
#include <set>

TEST(PriorityPoolTest, NewEntriesGetMaxPriority) {
  PriorityPool pool(10);
  pool.append(makeExperience(0, 1));
  EXPECT_DOUBLE_EQ(pool.getPriority(0), INITIAL_MAX_PRIORITY);

  pool.append(makeExperience(1, 1), 3.0);
  pool.append(makeExperience(2, 1));
  EXPECT_DOUBLE_EQ(pool.getPriority(2), 3.0);
  EXPECT_DOUBLE_EQ(pool.totalPriorityMass(), 7.0);
}

TEST(PriorityPoolTest, RejectsNonPositivePriority) {
  PriorityPool pool(4);
  EXPECT_THROW(pool.append(makeExperience(0, 1), 0.0), InvariantViolation);
  EXPECT_THROW(pool.append(makeExperience(0, 1), -1.0), InvariantViolation);
  EXPECT_EQ(pool.size(), 0u);
}

TEST(PriorityPoolTest, BoundedPoolEvictsOldest) {
  PriorityPool pool(3);
  for (int64_t i = 0; i < 5; i++) {
    pool.append(makeExperience(i, 1));
  }
  EXPECT_EQ(pool.size(), 3u);

  auto contents = pool.snapshot();
  ASSERT_EQ(contents.size(), 3u);
  EXPECT_EQ(stateId(contents[0].front()), 2);
  EXPECT_EQ(stateId(contents[1].front()), 3);
  EXPECT_EQ(stateId(contents[2].front()), 4);
}

TEST(PriorityPoolTest, UnboundedPoolGrows) {
  PriorityPool pool(0);
  const size_t n = DEMO_INITIAL_CAPACITY + 3;
  for (size_t i = 0; i < n; i++) {
    pool.append(makeExperience(static_cast<int64_t>(i), 1));
  }
  EXPECT_EQ(pool.size(), n);
  EXPECT_DOUBLE_EQ(pool.totalPriorityMass(), static_cast<double>(n));

  auto contents = pool.snapshot();
  EXPECT_EQ(stateId(contents.front().front()), 0);
  EXPECT_EQ(stateId(contents.back().front()), static_cast<int64_t>(n - 1));
}

TEST(PriorityPoolTest, SampleIsWithoutReplacementAndRestoresMass) {
  PriorityPool pool(8);
  for (int64_t i = 0; i < 8; i++) {
    pool.append(makeExperience(i, 1), 1.0 + i);
  }
  auto massBefore = pool.totalPriorityMass();

  std::mt19937 engine(7);
  auto drawn = pool.sample(8, engine);
  ASSERT_EQ(drawn.experiences.size(), 8u);
  ASSERT_EQ(drawn.probabilities.size(), 8u);

  std::set<int64_t> ids;
  for (size_t i = 0; i < drawn.experiences.size(); i++) {
    auto id = stateId(drawn.experiences[i].front());
    ids.insert(id);
    EXPECT_DOUBLE_EQ(drawn.probabilities[i], (1.0 + id) / massBefore);
  }
  EXPECT_EQ(ids.size(), 8u);
  EXPECT_DOUBLE_EQ(drawn.minProbability, 1.0 / massBefore);
  EXPECT_DOUBLE_EQ(pool.totalPriorityMass(), massBefore);
}

TEST(PriorityPoolTest, SampleLeavesEveryPriorityInPlace) {
  PriorityPool pool(6);
  for (int64_t i = 0; i < 6; i++) {
    pool.append(makeExperience(i, 1), 0.5 * (i + 1));
  }

  std::mt19937 engine(5);
  for (int round = 0; round < 3; round++) {
    auto drawn = pool.sample(4, engine);
    ASSERT_EQ(drawn.experiences.size(), 4u);
    // experiences come back in draw order
    for (size_t i = 0; i < drawn.experiences.size(); i++) {
      EXPECT_EQ(stateId(drawn.experiences[i].front()),
                static_cast<int64_t>(pool.getLastSampled()[i]));
    }
    for (size_t slot = 0; slot < 6; slot++) {
      EXPECT_DOUBLE_EQ(pool.getPriority(slot), 0.5 * (slot + 1));
    }
  }
}

TEST(PriorityPoolTest, SampleMoreThanHeldThrows) {
  PriorityPool pool(8);
  pool.append(makeExperience(0, 1));
  std::mt19937 engine(0);
  EXPECT_THROW(pool.sample(2, engine), UnderflowError);
}

TEST(PriorityPoolTest, SetLastPriorityFollowsDrawOrder) {
  PriorityPool pool(4);
  for (int64_t i = 0; i < 4; i++) {
    pool.append(makeExperience(i, 1));
  }
  std::mt19937 engine(3);
  auto drawn = pool.sample(2, engine);

  pool.setLastPriority({5.0, 0.5});
  auto slots = pool.getLastSampled();
  EXPECT_DOUBLE_EQ(pool.getPriority(slots[0]), 5.0);
  EXPECT_DOUBLE_EQ(pool.getPriority(slots[1]), 0.5);
  EXPECT_DOUBLE_EQ(pool.getMaxPriority(), 5.0);
  EXPECT_DOUBLE_EQ(pool.totalPriorityMass(), 7.5);
}

TEST(PriorityPoolTest, SetLastPriorityRejectsBadInput) {
  PriorityPool pool(4);
  for (int64_t i = 0; i < 4; i++) {
    pool.append(makeExperience(i, 1));
  }
  std::mt19937 engine(3);
  pool.sample(2, engine);

  EXPECT_THROW(pool.setLastPriority({1.0}), InvariantViolation);
  EXPECT_THROW(pool.setLastPriority({1.0, 0.0}), InvariantViolation);
}

TEST(PriorityPoolTest, HighPriorityDominatesDraws) {
  PriorityPool pool(2);
  pool.append(makeExperience(0, 1), 1.0);
  pool.append(makeExperience(1, 1), 99.0);

  std::mt19937 engine(11);
  int heavy = 0;
  for (int i = 0; i < 1000; i++) {
    auto drawn = pool.sample(1, engine);
    heavy += stateId(drawn.experiences[0].front()) == 1;
  }
  EXPECT_GT(heavy, 950);
}
