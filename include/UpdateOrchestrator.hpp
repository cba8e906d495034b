#ifndef UPDATE_ORCHESTRATOR_HPP
#define UPDATE_ORCHESTRATOR_HPP

#include "Agent.hpp"
#include "BatchAssembler.hpp"
#include "Config.hpp"
#include "DualReplayBuffer.hpp"
#include <torch/torch.h>
#include <vector>

struct UpdateResult {
  double loss = 0;
  double loss1Step = 0;
  double lossNStep = 0;
  double lossSupervised = 0;
  // priority-feeding errors, bonus included
  std::vector<double> errorsAgent;
  std::vector<double> errorsDemo;
};

// One DQfD update: 1-step and n-step double DQN losses over the whole batch,
// a large-margin supervised loss over its demonstration part, one optimizer
// step, and the 1-step errors written back as priorities.
class UpdateOrchestrator {
public:
  UpdateOrchestrator(const DQfDConfig &config_, Agent &agent_,
                     torch::optim::Optimizer &optimizer_,
                     DualReplayBuffer &replayBuffer_, BatchAssembler assembler_);

  UpdateResult update(std::vector<Experience> &experiencesAgent,
                      std::vector<Experience> &experiencesDemo);

  double getAverageLoss() const { return averageLoss; }

private:
  DQfDConfig config;
  Agent &agent;
  torch::optim::Optimizer &optimizer;
  DualReplayBuffer &replayBuffer;
  BatchAssembler assembler;

  double averageLoss = 0;
};

#endif // UPDATE_ORCHESTRATOR_HPP
