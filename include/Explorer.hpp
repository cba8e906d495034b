#ifndef EXPLORER_HPP
#define EXPLORER_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <random>

// Picks the action actually taken from the greedy one.
class Explorer {
public:
  virtual ~Explorer() = default;

  virtual int64_t selectAction(int64_t t,
                               const std::function<int64_t()> &greedyAction) = 0;
};

class Greedy : public Explorer {
public:
  int64_t selectAction(int64_t t,
                       const std::function<int64_t()> &greedyAction) override {
    return greedyAction();
  }
};

class ConstantEpsilonGreedy : public Explorer {
public:
  ConstantEpsilonGreedy(double epsilon_, int64_t nActions_,
                        std::optional<uint64_t> seed = std::nullopt);

  int64_t selectAction(int64_t t,
                       const std::function<int64_t()> &greedyAction) override;

protected:
  int64_t epsilonGreedy(double epsilon,
                        const std::function<int64_t()> &greedyAction);

  double epsilon;
  int64_t nActions;
  std::mt19937 engine;
};

// Epsilon moves linearly from startEpsilon to endEpsilon over decaySteps.
class LinearDecayEpsilonGreedy : public ConstantEpsilonGreedy {
public:
  LinearDecayEpsilonGreedy(double startEpsilon_, double endEpsilon_,
                           int64_t decaySteps_, int64_t nActions_,
                           std::optional<uint64_t> seed = std::nullopt);

  int64_t selectAction(int64_t t,
                       const std::function<int64_t()> &greedyAction) override;

  double computeEpsilon(int64_t t) const;

private:
  double startEpsilon;
  double endEpsilon;
  int64_t decaySteps;
};

#endif // EXPLORER_HPP
