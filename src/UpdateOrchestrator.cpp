#include "UpdateOrchestrator.hpp"
#include "Errors.hpp"
#include "Utils.hpp"

using namespace torch::indexing;

UpdateOrchestrator::UpdateOrchestrator(const DQfDConfig &config_, Agent &agent_,
                                       torch::optim::Optimizer &optimizer_,
                                       DualReplayBuffer &replayBuffer_,
                                       BatchAssembler assembler_)
    : config(config_), agent(agent_), optimizer(optimizer_),
      replayBuffer(replayBuffer_), assembler(std::move(assembler_)) {}

UpdateResult
UpdateOrchestrator::update(std::vector<Experience> &experiencesAgent,
                           std::vector<Experience> &experiencesDemo) {
  auto numExpAgent = static_cast<int64_t>(experiencesAgent.size());
  std::vector<Experience> experiences;
  experiences.reserve(experiencesAgent.size() + experiencesDemo.size());
  experiences.insert(experiences.end(), experiencesAgent.begin(),
                     experiencesAgent.end());
  experiences.insert(experiences.end(), experiencesDemo.begin(),
                     experiencesDemo.end());

  auto batch = assembler.toBatchedTrainData(experiences);

  // Q(s) is kept for the supervised loss
  auto qout = agent.onlineNet->forward(batch.state);
  auto batchQ = qout.evaluateActions(batch.action);

  torch::Tensor targetNStep, target1Step;
  {
    torch::NoGradGuard no_grad;

    auto nextOnlineNStep = agent.onlineNet->forward(batch.nextStateNStep);
    auto nextTargetNStep = agent.targetNet->forward(batch.nextStateNStep);
    targetNStep =
        doubleDQNTarget(batch.rewardNStep, batch.discount,
                        batch.isStateTerminal, nextOnlineNStep, nextTargetNStep);

    auto nextOnline1Step = agent.onlineNet->forward(batch.nextState1Step);
    auto nextTarget1Step = agent.targetNet->forward(batch.nextState1Step);
    // same discount and terminal mask as the n-step target
    target1Step =
        doubleDQNTarget(batch.reward1Step, batch.discount,
                        batch.isStateTerminal, nextOnline1Step, nextTarget1Step);
  }

  // priorities follow the 1-step error only
  auto errors = toVector(torch::abs(batchQ - target1Step));

  auto loss1Step = weightedValueLoss(batchQ, target1Step, batch.weights,
                                     config.clipDelta, config.batchAccumulator);
  auto lossNStep = weightedValueLoss(batchQ, targetNStep, batch.weights,
                                     config.clipDelta, config.batchAccumulator);

  UpdateResult ret;
  ret.errorsAgent.assign(errors.begin(), errors.begin() + numExpAgent);
  ret.errorsDemo.assign(errors.begin() + numExpAgent, errors.end());
  for (auto &e : ret.errorsAgent) {
    e += config.bonusPriorityAgent;
  }
  for (auto &e : ret.errorsDemo) {
    e += config.bonusPriorityDemo;
  }
  replayBuffer.updateErrors(ret.errorsAgent, ret.errorsDemo);

  auto qDemos = qout.qValues.index({Slice(numExpAgent, None)});
  auto actionsDemo = batch.action.index({Slice(numExpAgent, None)});
  auto lossSupervised =
      supervisedMarginLoss(qDemos, actionsDemo, config.demoSupervisedMargin,
                           config.batchAccumulator);

  // the L2 term is the optimizer's weight decay
  auto lossCombined = loss1Step + config.lossCoeffNStep * lossNStep +
                      config.lossCoeffSupervised * lossSupervised;

  optimizer.zero_grad();
  lossCombined.backward();
  optimizer.step();

  ret.loss = lossCombined.item<double>();
  ret.loss1Step = loss1Step.item<double>();
  ret.lossNStep = lossNStep.item<double>();
  ret.lossSupervised = lossSupervised.item<double>();

  averageLoss = decayedAverage(averageLoss, ret.loss, config.averageLossDecay);
  return ret;
}
