#include "BatchAssembler.hpp"
#include "Errors.hpp"
#include <cmath>

torch::Tensor
BatchAssembler::batchStates(const std::vector<torch::Tensor> &states) const {
  std::vector<torch::Tensor> features;
  features.reserve(states.size());
  for (const auto &state : states) {
    features.emplace_back(phi ? phi(state) : state);
  }
  return torch::stack(features, 0).to(device);
}

ExperienceBatch BatchAssembler::toBatchedTrainData(
    const std::vector<Experience> &experiences) const {
  if (experiences.empty()) {
    throw std::invalid_argument("cannot batch an empty list of experiences");
  }

  auto batchSize = static_cast<int64_t>(experiences.size());
  std::vector<torch::Tensor> states, nextStatesNStep, nextStates1Step;
  std::vector<int64_t> actions, nextActions;
  std::vector<float> rewardsNStep, rewards1Step, discounts, weights;
  std::vector<float> terminals;
  auto hasNextAction = true;

  // a missing next state only occurs on terminal steps, where it is masked
  auto nextStateOf = [](const RawTransition &transition) {
    return transition.nextState ? *transition.nextState
                                : torch::zeros_like(transition.state);
  };

  for (const auto &experience : experiences) {
    if (experience.size() == 0) {
      throw InvariantViolation("experience without transitions");
    }
    const auto &first = experience.front();
    const auto &last = experience.back();

    states.push_back(first.state);
    actions.push_back(first.action);

    double rewardNStep = 0;
    auto terminal = false;
    for (size_t j = 0; j < experience.size(); j++) {
      const auto &transition = experience.transitions[j];
      rewardNStep += std::pow(gamma, j) * transition.reward;
      terminal = terminal || transition.isStateTerminal;
    }
    rewardsNStep.push_back(static_cast<float>(rewardNStep));
    nextStatesNStep.push_back(nextStateOf(last));

    rewards1Step.push_back(first.reward);
    nextStates1Step.push_back(nextStateOf(first));

    terminals.push_back(terminal ? 1.0f : 0.0f);
    discounts.push_back(
        static_cast<float>(std::pow(gamma, experience.size())));
    weights.push_back(experience.weight);

    if (last.nextAction) {
      nextActions.push_back(*last.nextAction);
    } else {
      hasNextAction = false;
    }
  }

  auto floatTensor = [&](const std::vector<float> &values) {
    return torch::tensor(values, torch::kFloat32).to(device);
  };

  ExperienceBatch batch;
  batch.state = batchStates(states);
  batch.action = torch::tensor(actions, torch::kLong).to(device);
  batch.rewardNStep = floatTensor(rewardsNStep);
  batch.nextStateNStep = batchStates(nextStatesNStep);
  batch.reward1Step = floatTensor(rewards1Step);
  batch.nextState1Step = batchStates(nextStates1Step);
  batch.isStateTerminal = floatTensor(terminals);
  batch.discount = floatTensor(discounts);
  batch.weights = floatTensor(weights);
  if (hasNextAction) {
    batch.nextAction = torch::tensor(nextActions, torch::kLong).to(device);
  }

  if (batch.size() != batchSize) {
    throw InvariantViolation("batched states do not match the batch size");
  }
  return batch;
}
