#ifndef PRIORITY_WEIGHT_HPP
#define PRIORITY_WEIGHT_HPP

#include "Config.hpp"
#include <vector>

// Turns TD errors into pool priorities and sampling probabilities into
// importance sampling weights. Beta moves linearly from beta0 to 1, one step
// per weighted draw.
class PriorityWeight {
public:
  explicit PriorityWeight(const ReplayConfig &config);

  std::vector<double> priorityFromErrors(const std::vector<double> &errors) const;

  std::vector<float> weightsFromProbabilities(
      const std::vector<double> &probabilities, double minProbability,
      size_t poolSize);

  double getBeta() const { return beta; }

private:
  double alpha;
  double beta;
  double betaAdd;
  double eps;
  WeightNormalization normalization;
  std::optional<double> errorMin;
  std::optional<double> errorMax;
};

#endif // PRIORITY_WEIGHT_HPP
