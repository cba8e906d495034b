#include "TransitionWindowAggregator.hpp"
#include "Errors.hpp"
#include <string>

TransitionWindowAggregator::TransitionWindowAggregator(size_t nSteps_)
    : nSteps(nSteps_) {
  if (nSteps == 0) {
    throw ConfigurationError("n-step window length must be at least 1");
  }
}

Experience TransitionWindowAggregator::toExperience(const Window &window) {
  return Experience(std::vector<RawTransition>(window.begin(), window.end()));
}

void TransitionWindowAggregator::drain(Window &window,
                                       std::vector<Experience> &out) const {
  while (!window.empty()) {
    out.emplace_back(toExperience(window));
    window.pop_front();
  }
}

std::vector<Experience>
TransitionWindowAggregator::append(RawTransition transition, int envId) {
  std::vector<Experience> ret;
  auto &window = windows[envId];

  auto terminal = transition.isStateTerminal;
  window.emplace_back(std::move(transition));
  if (window.size() > nSteps) {
    window.pop_front();
  }

  if (terminal) {
    drain(window, ret);
    if (!window.empty()) {
      throw InvariantViolation("window of env " + std::to_string(envId) +
                               " not empty after terminal flush");
    }
  } else if (window.size() == nSteps) {
    ret.emplace_back(toExperience(window));
  }
  return ret;
}

std::vector<Experience>
TransitionWindowAggregator::stopCurrentEpisode(int envId) {
  std::vector<Experience> ret;
  auto it = windows.find(envId);
  if (it == windows.end()) {
    return ret;
  }
  auto &window = it->second;

  // a full window was already emitted by the step that filled it
  if (!window.empty() && window.size() < nSteps) {
    ret.emplace_back(toExperience(window));
  }
  // the oldest transition is covered by the window just emitted
  if (!window.empty() && window.size() <= nSteps) {
    window.pop_front();
  }
  drain(window, ret);

  if (!window.empty()) {
    throw InvariantViolation("window of env " + std::to_string(envId) +
                             " not empty after episode stop");
  }
  return ret;
}

size_t TransitionWindowAggregator::windowSize(int envId) const {
  auto it = windows.find(envId);
  return it == windows.end() ? 0 : it->second.size();
}
