#ifndef BATCH_ASSEMBLER_HPP
#define BATCH_ASSEMBLER_HPP

#include "StructuredData.hpp"
#include <functional>
#include <torch/torch.h>
#include <vector>

// State preprocessing applied wherever states are batched.
using Phi = std::function<torch::Tensor(const torch::Tensor &)>;

// Vectorizes experiences of 1..N transitions into aligned batch tensors.
class BatchAssembler {
public:
  BatchAssembler(double gamma_, Phi phi_ = nullptr,
                 torch::Device device_ = torch::Device(torch::kCPU))
      : gamma(gamma_), phi(phi_), device(device_) {}

  ExperienceBatch toBatchedTrainData(const std::vector<Experience> &experiences) const;

  torch::Tensor batchStates(const std::vector<torch::Tensor> &states) const;

private:
  double gamma;
  Phi phi;
  torch::Device device;
};

#endif // BATCH_ASSEMBLER_HPP
