#ifndef STRUCTURED_DATA_HPP
#define STRUCTURED_DATA_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <torch/torch.h>
#include <vector>

using NamedParameters = torch::OrderedDict<std::string, at::Tensor>;

// Which of the two priority pools an experience belongs to.
enum class PoolKind { Agent, Demo };

inline const char *poolName(PoolKind kind) {
  switch (kind) {
  case PoolKind::Agent:
    return "agent";
  case PoolKind::Demo:
    return "demo";
  }
  return "unknown";
}

// One environment step.
struct RawTransition {
  RawTransition() {}
  RawTransition(torch::Tensor state_, int64_t action_, float reward_,
                std::optional<torch::Tensor> nextState_ = std::nullopt,
                std::optional<int64_t> nextAction_ = std::nullopt,
                bool isStateTerminal_ = false)
      : state(state_), action(action_), reward(reward_), nextState(nextState_),
        nextAction(nextAction_), isStateTerminal(isStateTerminal_) {}

  torch::Tensor state;
  int64_t action = 0;
  float reward = 0;
  std::optional<torch::Tensor> nextState;
  std::optional<int64_t> nextAction;
  bool isStateTerminal = false;
  // auxiliary per-step values (e.g. behaviour policy probability)
  std::map<std::string, double> extras;
};

// 1..N consecutive transitions of one episode, oldest first.
struct Experience {
  Experience() {}
  explicit Experience(std::vector<RawTransition> transitions_)
      : transitions(std::move(transitions_)) {}

  size_t size() const { return transitions.size(); }
  const RawTransition &front() const { return transitions.front(); }
  const RawTransition &back() const { return transitions.back(); }

  std::vector<RawTransition> transitions;
  // importance sampling weight, only meaningful on a sampled copy
  float weight = 1.0f;
};

// compressed experience as kept in a pool slot
struct StoredData {
  size_t size = 0;
  std::unique_ptr<char[]> ptr;
};

struct PoolSample {
  std::vector<Experience> experiences;
  std::vector<double> probabilities;
  double minProbability = 0;
};

struct DualSample {
  std::vector<Experience> agent;
  std::vector<Experience> demo;

  size_t size() const { return agent.size() + demo.size(); }
};

struct ExperienceBatch {
  int64_t size() const { return state.size(0); }

  torch::Tensor state;
  torch::Tensor action;
  torch::Tensor rewardNStep;
  torch::Tensor nextStateNStep;
  torch::Tensor reward1Step;
  torch::Tensor nextState1Step;
  // any transition of the window is terminal
  torch::Tensor isStateTerminal;
  // gamma ^ window length
  torch::Tensor discount;
  torch::Tensor weights;
  std::optional<torch::Tensor> nextAction;
};

#endif // STRUCTURED_DATA_HPP
