#ifndef MODELS_HPP
#define MODELS_HPP

#include "StructuredData.hpp"
#include <memory>
#include <string>
#include <torch/torch.h>
#include <vector>

// Q-values of a batch of states, (batch, actions).
struct ActionValue {
  explicit ActionValue(torch::Tensor qValues_) : qValues(qValues_) {}

  torch::Tensor greedyActions() const { return std::get<1>(qValues.max(1)); }

  torch::Tensor max() const { return std::get<0>(qValues.max(1)); }

  // Q(s, a) for one action per row
  torch::Tensor evaluateActions(const torch::Tensor &actions) const {
    return qValues.gather(1, actions.to(torch::kLong).view({-1, 1}))
        .squeeze(1);
  }

  torch::Tensor qValues;
};

struct Model : torch::nn::Module {
  void saveStateDict(const std::string &file_name);
  void loadStateDict(const std::string &file_name,
                     const std::string &ignore_name_regex = "");

  void copyParams(const NamedParameters &newParams,
                  const NamedParameters &newBuffers);
  void copyFrom(Model &fromModel);

  // this <- (1 - tau) * this + tau * fromModel
  void softUpdateFrom(Model &fromModel, double tau);

  void requiresGrad_(bool grad) {
    for (auto &param : this->parameters(true /*recurse*/)) {
      param.requires_grad_(grad);
    }
  }
};

// State-action value estimator over a discrete action set.
struct QFunction : Model {
  explicit QFunction(int64_t nActions_) : nActions(nActions_) {}

  virtual ActionValue forward(const torch::Tensor &x) = 0;

  int64_t nActions;
};

// Fully connected ReLU head followed by a linear tail over the actions.
struct FCQFunction : QFunction {
  FCQFunction(int64_t nInput, int64_t n_actions,
              std::vector<int64_t> hiddenSizes = {64, 64});

  ActionValue forward(const torch::Tensor &x) override;

  std::vector<torch::nn::Linear> head;
  torch::nn::Linear tail{nullptr};
};

#endif // MODELS_HPP
