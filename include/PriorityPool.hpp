#ifndef PRIORITY_POOL_HPP
#define PRIORITY_POOL_HPP

#include "Common.hpp"
#include "ExperienceCodec.hpp"
#include "StructuredData.hpp"
#include "SumTree.hpp"
#include <random>
#include <vector>

// Weighted-sampling container of compressed experiences.
//
// A bounded pool (capacity > 0) is a ring: once full, every append overwrites
// the oldest slot. An unbounded pool (capacity == 0) grows and never evicts.
// New entries get the largest priority seen so far.
class PriorityPool {
public:
  PriorityPool(size_t capacity_, ExperienceCodec codec_ = ExperienceCodec());

  size_t size() const { return count; }
  size_t getCapacity() const { return capacity; }
  bool isBounded() const { return capacity > 0; }

  void append(const Experience &experience);
  void append(const Experience &experience, double priority);

  // Draws m distinct entries proportionally to priority.
  // Throws UnderflowError when m > size().
  PoolSample sample(size_t m, std::mt19937 &engine);

  // Assigns priorities to the last sampled entries, in draw order.
  void setLastPriority(const std::vector<double> &priorities);

  double totalPriorityMass() const { return tree.total(); }
  double minProbability() const;
  double getMaxPriority() const { return maxPriority; }

  double getPriority(size_t slot) const { return tree.get(slot); }
  const std::vector<size_t> &getLastSampled() const { return lastSampled; }

  // Decompressed copy of the oldest-to-newest contents, for inspection.
  std::vector<Experience> snapshot() const;

private:
  size_t capacity;
  size_t write = 0;
  size_t count = 0;
  double maxPriority = INITIAL_MAX_PRIORITY;

  SumTree tree;
  std::vector<StoredData> data;
  ExperienceCodec codec;
  std::vector<size_t> lastSampled;
};

#endif // PRIORITY_POOL_HPP
