#include "DualReplayBuffer.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <iostream>
#include <string>

namespace {

std::mt19937 makeEngine(const std::optional<uint64_t> &seed) {
  if (seed) {
    return std::mt19937(static_cast<std::mt19937::result_type>(*seed));
  }
  std::random_device rd;
  return std::mt19937(rd());
}

} // namespace

DualReplayBuffer::DualReplayBuffer(const ReplayConfig &config_)
    : config(config_),
      agentPool(config_.capacity, ExperienceCodec(config_.compressionLevel)),
      demoPool(0, ExperienceCodec(config_.compressionLevel)),
      windows(config_.nSteps), priorityWeight(config_),
      engine(makeEngine(config_.seed)) {
  if (config.capacity == 0) {
    throw ConfigurationError("agent pool capacity must be positive");
  }
}

PriorityPool &DualReplayBuffer::poolFor(PoolKind kind) {
  switch (kind) {
  case PoolKind::Agent:
    return agentPool;
  case PoolKind::Demo:
    return demoPool;
  }
  throw InvariantViolation("unknown pool kind");
}

const PriorityPool &DualReplayBuffer::getPool(PoolKind kind) const {
  switch (kind) {
  case PoolKind::Agent:
    return agentPool;
  case PoolKind::Demo:
    return demoPool;
  }
  throw InvariantViolation("unknown pool kind");
}

void DualReplayBuffer::store(PoolKind destination,
                             const std::vector<Experience> &experiences) {
  auto &pool = poolFor(destination);
  for (const auto &experience : experiences) {
    pool.append(experience);
  }

  if (config.verbose && !reportedFull && pool.isBounded() &&
      pool.size() == pool.getCapacity()) {
    reportedFull = true;
    std::cout << "Replay buffer reached its capacity of " << pool.getCapacity()
              << " " << poolName(destination)
              << " experiences, evicting the oldest from now on." << std::endl;
  }
}

void DualReplayBuffer::append(RawTransition transition, int envId,
                              PoolKind destination) {
  std::lock_guard<std::mutex> lock(mtx);
  store(destination, windows.append(std::move(transition), envId));
}

void DualReplayBuffer::stopCurrentEpisode(int envId, PoolKind destination) {
  std::lock_guard<std::mutex> lock(mtx);
  store(destination, windows.stopCurrentEpisode(envId));
}

std::vector<Experience> DualReplayBuffer::sampleFromPool(PoolKind kind,
                                                         size_t m) {
  auto &pool = poolFor(kind);
  if (pool.size() < m) {
    throw UnderflowError("cannot sample " + std::to_string(m) + " from the " +
                         poolName(kind) + " pool holding " +
                         std::to_string(pool.size()));
  }
  if (m == 0) {
    pool.sample(0, engine);
    return {};
  }

  auto drawn = pool.sample(m, engine);
  auto weights = priorityWeight.weightsFromProbabilities(
      drawn.probabilities, drawn.minProbability, pool.size());
  for (size_t i = 0; i < drawn.experiences.size(); i++) {
    drawn.experiences[i].weight = weights[i];
  }
  return std::move(drawn.experiences);
}

DualSample DualReplayBuffer::sample(size_t n, bool demoOnly) {
  std::lock_guard<std::mutex> lock(mtx);
  DualSample ret;

  if (demoOnly) {
    ret.demo = sampleFromPool(PoolKind::Demo, n);
    return ret;
  }

  auto psumAgent = agentPool.totalPriorityMass();
  auto psumDemo = demoPool.totalPriorityMass();
  if (psumAgent + psumDemo <= 0) {
    if (n > 0) {
      throw UnderflowError("cannot sample " + std::to_string(n) +
                           " from an empty replay buffer");
    }
    return ret;
  }

  std::binomial_distribution<size_t> binomial(n,
                                              psumAgent / (psumAgent + psumDemo));
  auto nsampleAgent = std::min(binomial(engine), agentPool.size());
  auto nsampleDemo = n - nsampleAgent;

  if (demoPool.size() < nsampleDemo) {
    throw UnderflowError("cannot sample " + std::to_string(nsampleDemo) +
                         " from the demo pool holding " +
                         std::to_string(demoPool.size()));
  }

  ret.agent = sampleFromPool(PoolKind::Agent, nsampleAgent);
  ret.demo = sampleFromPool(PoolKind::Demo, nsampleDemo);
  return ret;
}

void DualReplayBuffer::updateErrors(const std::vector<double> &errorsAgent,
                                    const std::vector<double> &errorsDemo) {
  std::lock_guard<std::mutex> lock(mtx);
  if (!errorsDemo.empty()) {
    demoPool.setLastPriority(priorityWeight.priorityFromErrors(errorsDemo));
  }
  if (!errorsAgent.empty()) {
    agentPool.setLastPriority(priorityWeight.priorityFromErrors(errorsAgent));
  }
}

size_t DualReplayBuffer::size() const {
  std::lock_guard<std::mutex> lock(mtx);
  return agentPool.size() + demoPool.size();
}

size_t DualReplayBuffer::agentSize() const {
  std::lock_guard<std::mutex> lock(mtx);
  return agentPool.size();
}

size_t DualReplayBuffer::demoSize() const {
  std::lock_guard<std::mutex> lock(mtx);
  return demoPool.size();
}

size_t DualReplayBuffer::windowSize(int envId) const {
  std::lock_guard<std::mutex> lock(mtx);
  return windows.windowSize(envId);
}

double DualReplayBuffer::getBeta() const {
  std::lock_guard<std::mutex> lock(mtx);
  return priorityWeight.getBeta();
}
