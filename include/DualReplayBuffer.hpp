#ifndef DUAL_REPLAY_BUFFER_HPP
#define DUAL_REPLAY_BUFFER_HPP

#include "Config.hpp"
#include "PriorityPool.hpp"
#include "PriorityWeight.hpp"
#include "TransitionWindowAggregator.hpp"
#include <mutex>
#include <random>

// Prioritized replay with two pools: a bounded pool of agent-generated
// experiences and an unbounded, never evicted pool of demonstrations.
// All public operations are serialized by one mutex.
class DualReplayBuffer {
public:
  explicit DualReplayBuffer(const ReplayConfig &config_);

  void append(RawTransition transition, int envId = 0,
              PoolKind destination = PoolKind::Agent);

  // Flushes the window of an episode interrupted without a terminal step.
  void stopCurrentEpisode(int envId = 0,
                          PoolKind destination = PoolKind::Agent);

  // Splits n between the pools proportionally to their priority mass.
  // With demoOnly every experience comes from the demonstration pool.
  DualSample sample(size_t n, bool demoOnly = false);

  // Errors in the order of the last draw from each pool; empty is a no-op.
  void updateErrors(const std::vector<double> &errorsAgent,
                    const std::vector<double> &errorsDemo);

  size_t size() const;
  size_t agentSize() const;
  size_t demoSize() const;
  size_t windowSize(int envId) const;
  double getBeta() const;

  const PriorityPool &getPool(PoolKind kind) const;
  const ReplayConfig &getConfig() const { return config; }

private:
  PriorityPool &poolFor(PoolKind kind);
  void store(PoolKind destination, const std::vector<Experience> &experiences);
  std::vector<Experience> sampleFromPool(PoolKind kind, size_t m);

  ReplayConfig config;
  PriorityPool agentPool;
  PriorityPool demoPool;
  TransitionWindowAggregator windows;
  PriorityWeight priorityWeight;
  std::mt19937 engine;
  mutable std::mutex mtx;
  bool reportedFull = false;
};

#endif // DUAL_REPLAY_BUFFER_HPP
