#include "PriorityWeight.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>

PriorityWeight::PriorityWeight(const ReplayConfig &config)
    : alpha(config.alpha), beta(config.beta0), eps(config.eps),
      normalization(config.normalization), errorMin(config.errorMin),
      errorMax(config.errorMax) {
  if (alpha < 0) {
    throw ConfigurationError("alpha must be non-negative");
  }
  if (beta < 0 || beta > 1) {
    throw ConfigurationError("beta0 must lie in [0, 1]");
  }
  if (!(eps > 0)) {
    throw ConfigurationError("priority eps must be positive");
  }
  if (errorMin && errorMax && *errorMin > *errorMax) {
    throw ConfigurationError("errorMin is larger than errorMax");
  }
  betaAdd = config.betaSteps > 0 ? (1.0 - beta) / config.betaSteps : 0.0;
}

std::vector<double>
PriorityWeight::priorityFromErrors(const std::vector<double> &errors) const {
  std::vector<double> ret;
  ret.reserve(errors.size());
  for (auto error : errors) {
    error = std::abs(error);
    if (errorMin) {
      error = std::max(*errorMin, error);
    }
    if (errorMax) {
      error = std::min(*errorMax, error);
    }
    ret.push_back(std::pow(error + eps, alpha));
  }
  return ret;
}

std::vector<float> PriorityWeight::weightsFromProbabilities(
    const std::vector<double> &probabilities, double minProbability,
    size_t poolSize) {
  if (normalization == WeightNormalization::Batch && !probabilities.empty()) {
    minProbability =
        *std::min_element(probabilities.begin(), probabilities.end());
  }

  std::vector<float> weights;
  weights.reserve(probabilities.size());
  for (auto p : probabilities) {
    double w;
    if (normalization == WeightNormalization::None) {
      w = std::pow(static_cast<double>(poolSize) * p, -beta);
    } else {
      w = std::pow(p / minProbability, -beta);
    }
    weights.push_back(static_cast<float>(w));
  }

  beta = std::min(1.0, beta + betaAdd);
  return weights;
}
