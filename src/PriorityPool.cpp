#include "PriorityPool.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

PriorityPool::PriorityPool(size_t capacity_, ExperienceCodec codec_)
    : capacity(capacity_),
      tree(capacity_ > 0 ? capacity_ : DEMO_INITIAL_CAPACITY),
      codec(codec_) {
  data.resize(tree.getCapacity());
}

void PriorityPool::append(const Experience &experience) {
  append(experience, maxPriority);
}

void PriorityPool::append(const Experience &experience, double priority) {
  if (!(priority > 0) || !std::isfinite(priority)) {
    throw InvariantViolation("pool priorities must be positive and finite, got " +
                             std::to_string(priority));
  }

  if (!isBounded() && write == tree.getCapacity()) {
    tree.grow(2 * tree.getCapacity());
    data.resize(tree.getCapacity());
  }

  data[write] = codec.compress(experience);
  tree.update(write, priority);
  maxPriority = std::max(maxPriority, priority);

  write += 1;
  if (isBounded() && write >= capacity) {
    write = 0;
  }
  if (!isBounded() || count < capacity) {
    count += 1;
  }
}

PoolSample PriorityPool::sample(size_t m, std::mt19937 &engine) {
  if (m > count) {
    throw UnderflowError("cannot sample " + std::to_string(m) +
                         " experiences from a pool holding " +
                         std::to_string(count));
  }

  PoolSample ret;
  lastSampled.clear();
  if (m == 0) {
    return ret;
  }

  auto total = tree.total();
  ret.minProbability = tree.min() / total;

  // each drawn slot is taken out of the tree until the draw is complete
  std::vector<double> drawnPriorities;
  for (size_t i = 0; i < m; i++) {
    std::uniform_real_distribution<double> dist(0.0, tree.total());
    auto slot = tree.retrieve(dist(engine));
    auto p = tree.get(slot);

    lastSampled.push_back(slot);
    drawnPriorities.push_back(p);
    ret.probabilities.push_back(p / total);

    tree.update(slot, 0);
  }
  for (size_t i = 0; i < m; i++) {
    tree.update(lastSampled[i], drawnPriorities[i]);
  }

  // decoded only once the tree is whole again
  ret.experiences.reserve(m);
  for (auto slot : lastSampled) {
    ret.experiences.emplace_back(codec.decompress(data[slot]));
  }
  return ret;
}

void PriorityPool::setLastPriority(const std::vector<double> &priorities) {
  if (priorities.size() != lastSampled.size()) {
    throw InvariantViolation(
        "got " + std::to_string(priorities.size()) +
        " priorities for a draw of " + std::to_string(lastSampled.size()));
  }
  for (size_t i = 0; i < priorities.size(); i++) {
    auto p = priorities[i];
    if (!(p > 0) || !std::isfinite(p)) {
      throw InvariantViolation(
          "pool priorities must be positive and finite, got " +
          std::to_string(p));
    }
    tree.update(lastSampled[i], p);
    maxPriority = std::max(maxPriority, p);
  }
}

double PriorityPool::minProbability() const {
  if (count == 0) {
    return 0;
  }
  return tree.min() / tree.total();
}

std::vector<Experience> PriorityPool::snapshot() const {
  std::vector<Experience> ret;
  ret.reserve(count);
  auto start = (isBounded() && count == capacity) ? write : 0;
  for (size_t i = 0; i < count; i++) {
    auto slot = isBounded() ? (start + i) % capacity : i;
    ret.emplace_back(codec.decompress(data[slot]));
  }
  return ret;
}
