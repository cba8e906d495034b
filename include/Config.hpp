#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "Common.hpp"
#include <cstdint>
#include <optional>

enum class WeightNormalization { None, Batch, Memory };
enum class BatchAccumulator { Mean, Sum };
enum class TargetUpdateMethod { Hard, Soft };

struct ReplayConfig {
  // agent pool capacity, demonstrations are never evicted
  size_t capacity = REPLAY_BUFFER_SIZE;
  size_t nSteps = N_STEPS;

  double alpha = PRIORITY_ALPHA;
  double beta0 = PRIORITY_BETA0;
  double betaSteps = PRIORITY_BETA_STEPS;
  double eps = PRIORITY_EPS;
  WeightNormalization normalization = WeightNormalization::Memory;
  std::optional<double> errorMin = PRIORITY_ERROR_MIN;
  std::optional<double> errorMax = PRIORITY_ERROR_MAX;

  int compressionLevel = COMPRESSION_LEVEL;
  std::optional<uint64_t> seed;
  bool verbose = true;
};

struct DQfDConfig {
  double gamma = DISCOUNT_GAMMA;

  double demoSupervisedMargin = DEMO_SUPERVISED_MARGIN;
  double bonusPriorityAgent = BONUS_PRIORITY_AGENT;
  double bonusPriorityDemo = BONUS_PRIORITY_DEMO;
  double lossCoeffNStep = LOSS_COEFF_NSTEP;
  double lossCoeffSupervised = LOSS_COEFF_SUPERVISED;
  double lossCoeffL2 = LOSS_COEFF_L2;

  double learningRate = LEARNING_RATE;
  double adamEps = EPSILON;

  size_t replayStartSize = REPLAY_START_SIZE;
  size_t minibatchSize = BATCH_SIZE;
  int64_t updateInterval = UPDATE_INTERVAL;
  size_t nTimesUpdate = N_TIMES_UPDATE;
  size_t nPretrainSteps = N_PRETRAIN_STEPS;

  int64_t targetUpdateInterval = TARGET_UPDATE;
  TargetUpdateMethod targetUpdateMethod = TargetUpdateMethod::Hard;
  double softUpdateTau = SOFT_UPDATE_TAU;

  bool clipDelta = true;
  BatchAccumulator batchAccumulator = BatchAccumulator::Mean;

  double averageQDecay = AVERAGE_Q_DECAY;
  double averageLossDecay = AVERAGE_LOSS_DECAY;
  bool verbose = true;
};

#endif // CONFIG_HPP
