#include "Learner.hpp"
#include "Errors.hpp"
#include "Utils.hpp"
#include <iostream>

// window id used while loading recorded demonstrations
const auto DEMO_ENV_ID = -1;

Learner::Learner(const DQfDConfig &config_, const ReplayConfig &replayConfig,
                 const QFunctionFactory &factory,
                 std::shared_ptr<Explorer> explorer_, Phi phi_,
                 torch::Device device)
    : config(config_), agent(factory, device),
      optimizer(agent.onlineNet->parameters(),
                torch::optim::AdamOptions(config_.learningRate)
                    .eps(config_.adamEps)
                    .weight_decay(config_.lossCoeffL2)),
      replayBuffer(replayConfig),
      orchestrator(config_, agent, optimizer, replayBuffer,
                   BatchAssembler(config_.gamma, phi_, device)),
      scheduler(
          replayBuffer,
          [this](std::vector<Experience> &experiencesAgent,
                 std::vector<Experience> &experiencesDemo) {
            lastUpdate = orchestrator.update(experiencesAgent, experiencesDemo);
          },
          config_.minibatchSize, config_.nTimesUpdate, config_.replayStartSize,
          config_.updateInterval, config_.verbose),
      explorer(std::move(explorer_)),
      assembler(config_.gamma, phi_, device) {
  if (!explorer) {
    throw ConfigurationError("learner needs an explorer");
  }
  if (config.targetUpdateInterval <= 0) {
    throw ConfigurationError("target update interval must be positive");
  }
  if (config.targetUpdateMethod == TargetUpdateMethod::Soft &&
      (config.softUpdateTau <= 0 || config.softUpdateTau > 1)) {
    throw ConfigurationError("soft update tau must lie in (0, 1]");
  }
}

void Learner::loadDemonstrations(
    const std::vector<std::vector<RawTransition>> &episodes) {
  for (const auto &episode : episodes) {
    if (episode.empty()) {
      continue;
    }
    for (const auto &transition : episode) {
      replayBuffer.append(transition, DEMO_ENV_ID, PoolKind::Demo);
    }
    if (!episode.back().isStateTerminal) {
      replayBuffer.stopCurrentEpisode(DEMO_ENV_ID, PoolKind::Demo);
    }
  }

  if (config.verbose) {
    std::cout << "Loaded " << episodes.size() << " demonstration episodes, "
              << replayBuffer.demoSize() << " demo experiences." << std::endl;
  }
}

void Learner::pretrain() {
  for (size_t tpre = 0; tpre < config.nPretrainSteps; tpre++) {
    scheduler.updateFromDemonstrations();
    if (static_cast<int64_t>(tpre) % config.targetUpdateInterval == 0) {
      syncTargetNetwork();
    }
    if (config.verbose && (tpre % PRETRAIN_PRINT_INTERVAL == 0 ||
                           tpre + 1 == config.nPretrainSteps)) {
      std::cout << "Pretrain step " << tpre
                << ", average loss = " << orchestrator.getAverageLoss()
                << std::endl;
    }
  }
}

ActionValue Learner::evaluate(const std::vector<torch::Tensor> &batchObs) {
  torch::NoGradGuard no_grad;
  return agent.onlineNet->forward(assembler.batchStates(batchObs));
}

void Learner::syncTargetNetwork() {
  agent.syncTarget(config.targetUpdateMethod, config.softUpdateTau);
}

void Learner::tickTargetUpdate() {
  if (t % config.targetUpdateInterval == 0) {
    syncTargetNetwork();
  }
}

int64_t Learner::act(const torch::Tensor &obs) {
  auto actionValue = evaluate({obs});
  return actionValue.greedyActions().item<int64_t>();
}

int64_t Learner::actAndTrain(const torch::Tensor &obs, float reward) {
  auto actionValue = evaluate({obs});
  auto q = actionValue.max().item<double>();
  auto greedyAction = actionValue.greedyActions().item<int64_t>();

  averageQ = decayedAverage(averageQ, q, config.averageQDecay);

  auto action =
      explorer->selectAction(t, [greedyAction] { return greedyAction; });
  t += 1;

  tickTargetUpdate();

  if (lastState) {
    if (!lastAction) {
      throw InvariantViolation("last state recorded without its action");
    }
    replayBuffer.append(RawTransition(*lastState, *lastAction, reward, obs,
                                      action, false));
  }

  lastState = obs;
  lastAction = action;

  scheduler.updateIfNecessary(t);
  return action;
}

void Learner::stopEpisodeAndTrain(const torch::Tensor &obs, float reward,
                                  bool done) {
  if (!lastState || !lastAction) {
    throw InvariantViolation("episode stopped before any action was taken");
  }
  replayBuffer.append(RawTransition(*lastState, *lastAction, reward, obs,
                                    *lastAction, done));
  stopEpisode();
}

void Learner::stopEpisode() {
  lastState.reset();
  lastAction.reset();
  replayBuffer.stopCurrentEpisode();
}

std::vector<int64_t>
Learner::batchAct(const std::vector<torch::Tensor> &batchObs) {
  auto greedyActions = evaluate(batchObs).greedyActions().to(torch::kCPU);
  std::vector<int64_t> ret(batchObs.size());
  for (size_t i = 0; i < ret.size(); i++) {
    ret[i] = greedyActions[i].item<int64_t>();
  }
  return ret;
}

std::vector<int64_t>
Learner::batchActAndTrain(const std::vector<torch::Tensor> &batchObs) {
  auto actionValue = evaluate(batchObs);
  auto batchMaxQ = actionValue.max();
  auto greedyActions = actionValue.greedyActions().to(torch::kCPU);

  std::vector<int64_t> batchAction(batchObs.size());
  for (size_t i = 0; i < batchAction.size(); i++) {
    auto greedyAction = greedyActions[i].item<int64_t>();
    batchAction[i] =
        explorer->selectAction(t, [greedyAction] { return greedyAction; });
  }

  batchLastObs.assign(batchObs.begin(), batchObs.end());
  batchLastAction.assign(batchAction.begin(), batchAction.end());

  averageQ = decayedAverage(averageQ, batchMaxQ.mean().item<double>(),
                            config.averageQDecay);
  return batchAction;
}

void Learner::batchObserveAndTrain(const std::vector<torch::Tensor> &batchObs,
                                   const std::vector<float> &batchReward,
                                   const std::vector<bool> &batchDone,
                                   const std::vector<bool> &batchReset) {
  auto n = batchObs.size();
  if (batchReward.size() != n || batchDone.size() != n ||
      batchReset.size() != n) {
    throw std::invalid_argument("batch observation sizes differ");
  }

  for (size_t i = 0; i < n; i++) {
    t += 1;
    tickTargetUpdate();

    if (i < batchLastObs.size() && batchLastObs[i]) {
      if (!batchLastAction[i]) {
        throw InvariantViolation("last observation recorded without action");
      }
      auto envId = static_cast<int>(i);
      replayBuffer.append(RawTransition(*batchLastObs[i], *batchLastAction[i],
                                        batchReward[i], batchObs[i],
                                        std::nullopt, batchDone[i]),
                          envId);
      if (batchReset[i] || batchDone[i]) {
        batchLastObs[i].reset();
        replayBuffer.stopCurrentEpisode(envId);
      }
    }
    scheduler.updateIfNecessary(t);
  }
}

Statistics Learner::getStatistics() const {
  Statistics stats;
  stats.averageQ = averageQ;
  stats.averageLoss = orchestrator.getAverageLoss();
  stats.updateCount = scheduler.getUpdateCount();
  stats.agentSize = replayBuffer.agentSize();
  stats.demoSize = replayBuffer.demoSize();
  return stats;
}
