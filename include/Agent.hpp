#ifndef AGENT_HPP
#define AGENT_HPP

#include "Config.hpp"
#include "Models.hpp"
#include <functional>
#include <memory>

using QFunctionFactory = std::function<std::shared_ptr<QFunction>()>;

// Online estimator and its frozen target copy.
class Agent {
public:
  Agent(const QFunctionFactory &factory,
        torch::Device device_ = torch::Device(torch::kCPU))
      : onlineNet(factory()), targetNet(factory()), device(device_) {
    onlineNet->to(device);
    targetNet->to(device);

    // the target estimator never receives gradients
    targetNet->requiresGrad_(false);
    targetNet->copyFrom(*onlineNet);
  }

  void syncTarget(TargetUpdateMethod method, double tau) {
    switch (method) {
    case TargetUpdateMethod::Hard:
      targetNet->copyFrom(*onlineNet);
      break;
    case TargetUpdateMethod::Soft:
      targetNet->softUpdateFrom(*onlineNet, tau);
      break;
    }
    syncCount++;
  }

  std::shared_ptr<QFunction> onlineNet;
  std::shared_ptr<QFunction> targetNet;
  torch::Device device;

  int syncCount = 0;
};

#endif // AGENT_HPP
