#ifndef UTILS_HPP
#define UTILS_HPP

#include "Config.hpp"
#include "Models.hpp"
#include <torch/torch.h>
#include <vector>

// Importance-weighted TD loss. Huber (delta 1) when clipDelta, otherwise
// half squared error.
torch::Tensor weightedValueLoss(const torch::Tensor &y, const torch::Tensor &t,
                                const torch::Tensor &weights, bool clipDelta,
                                BatchAccumulator accumulator);

// Large-margin classification loss over expert actions:
// max_a [Q(s, a) + l(aE, a)] - Q(s, aE), with l = margin except at aE.
// An empty batch gives a zero loss.
torch::Tensor supervisedMarginLoss(const torch::Tensor &qValues,
                                   const torch::Tensor &expertActions,
                                   double margin, BatchAccumulator accumulator);

// r + discount * (1 - terminal) * Q_target(s', argmax_a Q_online(s', a))
torch::Tensor doubleDQNTarget(const torch::Tensor &reward,
                              const torch::Tensor &discount,
                              const torch::Tensor &terminal,
                              const ActionValue &nextOnline,
                              const ActionValue &nextTarget);

double decayedAverage(double average, double value, double decay);

std::vector<double> toVector(const torch::Tensor &tensor);

#endif // UTILS_HPP
