#include "Utils.hpp"

namespace {

torch::Tensor accumulate(const torch::Tensor &losses,
                         BatchAccumulator accumulator, int64_t batchSize) {
  auto lossSum = torch::sum(losses);
  if (accumulator == BatchAccumulator::Mean && batchSize > 0) {
    return lossSum / static_cast<double>(batchSize);
  }
  return lossSum;
}

} // namespace

torch::Tensor weightedValueLoss(const torch::Tensor &y, const torch::Tensor &t,
                                const torch::Tensor &weights, bool clipDelta,
                                BatchAccumulator accumulator) {
  auto yFlat = y.reshape({-1});
  auto tFlat = t.reshape({-1});

  torch::Tensor losses;
  if (clipDelta) {
    losses = torch::smooth_l1_loss(yFlat, tFlat, at::Reduction::None);
  } else {
    losses = torch::square(yFlat - tFlat) / 2;
  }
  return accumulate(losses * weights.reshape({-1}), accumulator,
                    yFlat.size(0));
}

torch::Tensor supervisedMarginLoss(const torch::Tensor &qValues,
                                   const torch::Tensor &expertActions,
                                   double margin, BatchAccumulator accumulator) {
  auto nDemo = qValues.size(0);
  if (nDemo == 0) {
    return torch::zeros({}, qValues.options());
  }

  auto actions = expertActions.to(torch::kLong).view({-1, 1});
  auto margins = torch::full_like(qValues, margin)
                     .scatter_(1, actions, 0.0)
                     .detach();

  auto supervisedTargets = std::get<0>(torch::max(qValues + margins, 1));
  auto qExpert = qValues.gather(1, actions).squeeze(1);
  return accumulate(supervisedTargets - qExpert, accumulator, nDemo);
}

torch::Tensor doubleDQNTarget(const torch::Tensor &reward,
                              const torch::Tensor &discount,
                              const torch::Tensor &terminal,
                              const ActionValue &nextOnline,
                              const ActionValue &nextTarget) {
  auto nextQMax = nextTarget.evaluateActions(nextOnline.greedyActions());
  return reward + discount * (1.0 - terminal.to(torch::kFloat32)) * nextQMax;
}

double decayedAverage(double average, double value, double decay) {
  return decay * average + (1 - decay) * value;
}

std::vector<double> toVector(const torch::Tensor &tensor) {
  auto cpu = tensor.detach().to(torch::kCPU, torch::kDouble).contiguous();
  auto ptr = cpu.data_ptr<double>();
  return std::vector<double>(ptr, ptr + cpu.numel());
}
