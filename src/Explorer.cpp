#include "Explorer.hpp"
#include "Errors.hpp"

namespace {

std::mt19937 makeEngine(const std::optional<uint64_t> &seed) {
  if (seed) {
    return std::mt19937(static_cast<std::mt19937::result_type>(*seed));
  }
  std::random_device rd;
  return std::mt19937(rd());
}

} // namespace

ConstantEpsilonGreedy::ConstantEpsilonGreedy(double epsilon_, int64_t nActions_,
                                             std::optional<uint64_t> seed)
    : epsilon(epsilon_), nActions(nActions_), engine(makeEngine(seed)) {
  if (epsilon < 0 || epsilon > 1) {
    throw ConfigurationError("epsilon must lie in [0, 1]");
  }
  if (nActions < 1) {
    throw ConfigurationError("an explorer needs at least one action");
  }
}

int64_t ConstantEpsilonGreedy::epsilonGreedy(
    double eps, const std::function<int64_t()> &greedyAction) {
  std::uniform_real_distribution<double> prob(0.0, 1.0);
  if (prob(engine) < eps) {
    std::uniform_int_distribution<int64_t> randomAction(0, nActions - 1);
    return randomAction(engine);
  }
  return greedyAction();
}

int64_t ConstantEpsilonGreedy::selectAction(
    int64_t t, const std::function<int64_t()> &greedyAction) {
  return epsilonGreedy(epsilon, greedyAction);
}

LinearDecayEpsilonGreedy::LinearDecayEpsilonGreedy(
    double startEpsilon_, double endEpsilon_, int64_t decaySteps_,
    int64_t nActions_, std::optional<uint64_t> seed)
    : ConstantEpsilonGreedy(startEpsilon_, nActions_, seed),
      startEpsilon(startEpsilon_), endEpsilon(endEpsilon_),
      decaySteps(decaySteps_) {
  if (endEpsilon < 0 || endEpsilon > 1) {
    throw ConfigurationError("epsilon must lie in [0, 1]");
  }
  if (decaySteps < 0) {
    throw ConfigurationError("decay steps must be non-negative");
  }
}

double LinearDecayEpsilonGreedy::computeEpsilon(int64_t t) const {
  if (t >= decaySteps) {
    return endEpsilon;
  }
  auto ratio = static_cast<double>(t) / decaySteps;
  return startEpsilon + ratio * (endEpsilon - startEpsilon);
}

int64_t LinearDecayEpsilonGreedy::selectAction(
    int64_t t, const std::function<int64_t()> &greedyAction) {
  epsilon = computeEpsilon(t);
  return epsilonGreedy(epsilon, greedyAction);
}
