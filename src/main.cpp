#include "Learner.hpp"
#include <algorithm>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <numeric>
#include <tuple>

const auto CHAIN_LENGTH = 10;
const auto CHAIN_ACTIONS = 2; // 0: left, 1: right
const auto NUM_ENVS = 4;
const auto NUM_DEMO_EPISODES = 20;
const auto NUM_TRAIN_STEPS = 20000;
const auto PRINT_INTERVAL = 1000;

// Walk along a chain of cells; reaching the right end gives reward 1 and
// terminates. Episodes are cut after twice the chain length.
class ChainEnv {
public:
  torch::Tensor reset() {
    position = 0;
    steps = 0;
    return observe();
  }

  // returns (observation, reward, done, reset)
  std::tuple<torch::Tensor, float, bool, bool> step(int64_t action) {
    position += action == 1 ? 1 : -1;
    position = std::max<int64_t>(position, 0);
    steps++;
    auto done = position == CHAIN_LENGTH - 1;
    auto truncated = !done && steps >= 2 * CHAIN_LENGTH;
    return {observe(), done ? 1.0f : 0.0f, done, truncated};
  }

private:
  torch::Tensor observe() const {
    auto obs = torch::zeros({CHAIN_LENGTH});
    obs[position] = 1.0;
    return obs;
  }

  int64_t position = 0;
  int64_t steps = 0;
};

std::vector<std::vector<RawTransition>> recordDemonstrations(int numEpisodes) {
  std::vector<std::vector<RawTransition>> episodes;
  ChainEnv env;
  for (auto e = 0; e < numEpisodes; e++) {
    std::vector<RawTransition> episode;
    auto obs = env.reset();
    auto done = false;
    while (!done) {
      // the expert always walks right
      int64_t action = 1;
      auto [nextObs, reward, terminal, truncated] = env.step(action);
      done = terminal || truncated;
      episode.emplace_back(obs, action, reward, nextObs, action, terminal);
      obs = nextObs;
    }
    episodes.push_back(std::move(episode));
  }
  return episodes;
}

int main(void) {
  DQfDConfig config;
  config.replayStartSize = 1000;
  config.nPretrainSteps = 500;
  config.targetUpdateInterval = 500;
  config.learningRate = 1e-3;

  ReplayConfig replayConfig;
  replayConfig.capacity = 50000;
  replayConfig.nSteps = 5;
  replayConfig.betaSteps = NUM_TRAIN_STEPS;
  replayConfig.seed = 0;

  auto explorer = std::make_shared<LinearDecayEpsilonGreedy>(
      1.0, 0.05, NUM_TRAIN_STEPS / 2, CHAIN_ACTIONS, 0);

  Learner learner(
      config, replayConfig,
      [] { return std::make_shared<FCQFunction>(CHAIN_LENGTH, CHAIN_ACTIONS); },
      explorer);

  learner.loadDemonstrations(recordDemonstrations(NUM_DEMO_EPISODES));
  learner.pretrain();

  std::vector<ChainEnv> envs(NUM_ENVS);
  std::vector<torch::Tensor> batchObs;
  for (auto &env : envs) {
    batchObs.push_back(env.reset());
  }

  std::vector<float> episodeReturns(NUM_ENVS, 0);
  std::deque<float> finishedReturns;

  while (learner.getStep() < NUM_TRAIN_STEPS) {
    auto batchAction = learner.batchActAndTrain(batchObs);

    std::vector<float> batchReward(NUM_ENVS);
    std::vector<bool> batchDone(NUM_ENVS), batchReset(NUM_ENVS);
    for (auto i = 0; i < NUM_ENVS; i++) {
      auto [obs, reward, done, truncated] = envs[i].step(batchAction[i]);
      batchObs[i] = obs;
      batchReward[i] = reward;
      batchDone[i] = done;
      batchReset[i] = truncated;
      episodeReturns[i] += reward;
    }

    learner.batchObserveAndTrain(batchObs, batchReward, batchDone, batchReset);

    for (auto i = 0; i < NUM_ENVS; i++) {
      if (batchDone[i] || batchReset[i]) {
        finishedReturns.push_back(episodeReturns[i]);
        if (finishedReturns.size() > 100) {
          finishedReturns.pop_front();
        }
        episodeReturns[i] = 0;
        batchObs[i] = envs[i].reset();
      }
    }

    if (learner.getStep() % PRINT_INTERVAL < NUM_ENVS) {
      auto stats = learner.getStatistics();
      auto meanReturn =
          finishedReturns.empty()
              ? 0.0
              : std::accumulate(finishedReturns.begin(),
                                finishedReturns.end(), 0.0) /
                    finishedReturns.size();
      std::cout << "steps = " << learner.getStep()
                << ", loss = " << stats.averageLoss
                << ", Q = " << stats.averageQ << ", return = " << meanReturn
                << ", agent = " << stats.agentSize
                << ", demo = " << stats.demoSize << std::endl;
    }
  }

  learner.getAgent().onlineNet->saveStateDict("model.pt");
  return EXIT_SUCCESS;
}
