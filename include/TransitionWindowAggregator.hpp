#ifndef TRANSITION_WINDOW_AGGREGATOR_HPP
#define TRANSITION_WINDOW_AGGREGATOR_HPP

#include "StructuredData.hpp"
#include <deque>
#include <unordered_map>
#include <vector>

// Sliding window of the last N transitions per environment id.
//
// append() returns the experiences that become final with this step:
//  - a non-terminal step emits the whole window once it holds N transitions;
//    the window keeps sliding.
//  - a terminal step emits the window and each of its suffixes down to
//    length 1, then clears it.
// stopCurrentEpisode() flushes an episode that ended without a terminal flag.
class TransitionWindowAggregator {
public:
  explicit TransitionWindowAggregator(size_t nSteps_);

  std::vector<Experience> append(RawTransition transition, int envId = 0);

  std::vector<Experience> stopCurrentEpisode(int envId = 0);

  size_t windowSize(int envId) const;
  size_t getNumSteps() const { return nSteps; }

private:
  using Window = std::deque<RawTransition>;

  static Experience toExperience(const Window &window);
  void drain(Window &window, std::vector<Experience> &out) const;

  size_t nSteps;
  std::unordered_map<int, Window> windows;
};

#endif // TRANSITION_WINDOW_AGGREGATOR_HPP
