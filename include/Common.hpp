#ifndef COMMON_HPP
#define COMMON_HPP

#include <cstddef>

// replay
const auto N_STEPS = 10;
const auto REPLAY_BUFFER_SIZE = 1000000;
const auto DEMO_INITIAL_CAPACITY = 1024;
const auto REPLAY_BUFFER_ADD_PRINT_SIZE = 500;
const auto PRETRAIN_PRINT_INTERVAL = 100;
const auto COMPRESSION_LEVEL = 3; // ZSTD_CLEVEL_DEFAULT

// prioritization
const auto PRIORITY_ALPHA = 0.6;
const auto PRIORITY_BETA0 = 0.4;
const auto PRIORITY_BETA_STEPS = 2e5;
const auto PRIORITY_EPS = 0.01;
const auto PRIORITY_ERROR_MIN = 0.0;
const auto PRIORITY_ERROR_MAX = 1.0;
const auto INITIAL_MAX_PRIORITY = 1.0;

// DQfD
const auto DISCOUNT_GAMMA = 0.99;
const auto DEMO_SUPERVISED_MARGIN = 0.8;
const auto BONUS_PRIORITY_AGENT = 0.001;
const auto BONUS_PRIORITY_DEMO = 1.0;
const auto LOSS_COEFF_NSTEP = 1.0;
const auto LOSS_COEFF_SUPERVISED = 1.0;
const auto LOSS_COEFF_L2 = 1e-5;

// update schedule
const auto REPLAY_START_SIZE = 50000;
const auto BATCH_SIZE = 32;
const auto UPDATE_INTERVAL = 1;
const auto N_TIMES_UPDATE = 1;
const auto N_PRETRAIN_STEPS = 1000;
const auto TARGET_UPDATE = 10000;
const auto SOFT_UPDATE_TAU = 1e-2;

// optimizer
const auto LEARNING_RATE = 1e-4;
const auto EPSILON = 1e-3;

// statistics
const auto AVERAGE_Q_DECAY = 0.999;
const auto AVERAGE_LOSS_DECAY = 0.99;

#endif // COMMON_HPP
