#ifndef SUM_TREE_HPP
#define SUM_TREE_HPP

#include <algorithm>
#include <cstddef>
#include <limits>
#include <vector>

// Priorities indexed by slot, with the sum and the minimum of every subtree.
// Unused slots hold priority 0 and never take part in the minimum.
class SumTree {
public:
  explicit SumTree(size_t capacity_) { reset(capacity_); }

  double total() const { return sums[1]; }

  // smallest positive priority, +inf when every slot is empty
  double min() const { return mins[1]; }

  double get(size_t slot) const { return sums[leaves + slot]; }

  size_t getCapacity() const { return capacity; }

  void update(size_t slot, double p) {
    auto idx = leaves + slot;
    sums[idx] = p;
    mins[idx] = p > 0 ? p : std::numeric_limits<double>::infinity();
    propagate(idx);
  }

  // Slot whose cumulative priority range contains s, s in [0, total()).
  size_t retrieve(double s) const {
    size_t idx = 1;
    while (idx < leaves) {
      auto left = 2 * idx;
      auto right = left + 1;
      if ((s < sums[left] && sums[left] > 0) || sums[right] <= 0) {
        idx = left;
      } else {
        s -= sums[left];
        idx = right;
      }
    }
    return idx - leaves;
  }

  // Resize keeping every slot's priority.
  void grow(size_t newCapacity) {
    if (newCapacity <= capacity) {
      return;
    }
    std::vector<double> priorities(capacity);
    for (size_t i = 0; i < capacity; i++) {
      priorities[i] = get(i);
    }
    reset(newCapacity);
    for (size_t i = 0; i < priorities.size(); i++) {
      sums[leaves + i] = priorities[i];
      mins[leaves + i] = priorities[i] > 0
                             ? priorities[i]
                             : std::numeric_limits<double>::infinity();
    }
    for (auto idx = leaves - 1; idx > 0; idx--) {
      pull(idx);
    }
  }

private:
  void reset(size_t capacity_) {
    capacity = std::max<size_t>(capacity_, 1);
    leaves = 1;
    while (leaves < capacity) {
      leaves *= 2;
    }
    sums.assign(2 * leaves, 0.0);
    mins.assign(2 * leaves, std::numeric_limits<double>::infinity());
  }

  void pull(size_t idx) {
    sums[idx] = sums[2 * idx] + sums[2 * idx + 1];
    mins[idx] = std::min(mins[2 * idx], mins[2 * idx + 1]);
  }

  void propagate(size_t idx) {
    if (idx <= 1) {
      return;
    }
    auto parent = idx / 2;
    pull(parent);
    propagate(parent);
  }

  size_t capacity;
  size_t leaves;
  std::vector<double> sums;
  std::vector<double> mins;
};

#endif // SUM_TREE_HPP
