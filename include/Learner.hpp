#ifndef LEARNER_HPP
#define LEARNER_HPP

#include "Agent.hpp"
#include "BatchAssembler.hpp"
#include "Config.hpp"
#include "DualReplayBuffer.hpp"
#include "Explorer.hpp"
#include "UpdateOrchestrator.hpp"
#include "UpdateScheduler.hpp"
#include <memory>
#include <optional>
#include <vector>

struct Statistics {
  double averageQ = 0;
  double averageLoss = 0;
  size_t updateCount = 0;
  size_t agentSize = 0;
  size_t demoSize = 0;
};

// Deep Q-learning from demonstrations.
//
// Environment steps go through the dual replay buffer, the scheduler fires
// updates, and the orchestrator trains the online estimator. pretrain() must
// be called after loadDemonstrations() and before any environment step.
class Learner {
public:
  Learner(const DQfDConfig &config_, const ReplayConfig &replayConfig,
          const QFunctionFactory &factory, std::shared_ptr<Explorer> explorer_,
          Phi phi_ = nullptr,
          torch::Device device = torch::Device(torch::kCPU));

  // Expert episodes into the demonstration pool. An episode whose last step
  // is not terminal is flushed as an interrupted episode.
  void loadDemonstrations(const std::vector<std::vector<RawTransition>> &episodes);

  void pretrain();

  int64_t act(const torch::Tensor &obs);
  int64_t actAndTrain(const torch::Tensor &obs, float reward);
  void stopEpisodeAndTrain(const torch::Tensor &obs, float reward, bool done);
  void stopEpisode();

  std::vector<int64_t> batchAct(const std::vector<torch::Tensor> &batchObs);
  std::vector<int64_t> batchActAndTrain(const std::vector<torch::Tensor> &batchObs);
  void batchObserveAndTrain(const std::vector<torch::Tensor> &batchObs,
                            const std::vector<float> &batchReward,
                            const std::vector<bool> &batchDone,
                            const std::vector<bool> &batchReset);

  void syncTargetNetwork();

  Statistics getStatistics() const;
  int64_t getStep() const { return t; }
  DualReplayBuffer &getReplayBuffer() { return replayBuffer; }
  Agent &getAgent() { return agent; }
  const UpdateResult &getLastUpdate() const { return lastUpdate; }

private:
  ActionValue evaluate(const std::vector<torch::Tensor> &batchObs);
  void tickTargetUpdate();

  DQfDConfig config;
  Agent agent;
  torch::optim::Adam optimizer;
  DualReplayBuffer replayBuffer;
  UpdateOrchestrator orchestrator;
  UpdateScheduler scheduler;
  std::shared_ptr<Explorer> explorer;
  BatchAssembler assembler;

  int64_t t = 0;
  double averageQ = 0;
  UpdateResult lastUpdate;

  std::optional<torch::Tensor> lastState;
  std::optional<int64_t> lastAction;
  std::vector<std::optional<torch::Tensor>> batchLastObs;
  std::vector<std::optional<int64_t>> batchLastAction;
};

#endif // LEARNER_HPP
