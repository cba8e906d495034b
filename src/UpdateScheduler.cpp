#include "UpdateScheduler.hpp"
#include "Errors.hpp"
#include <iostream>
#include <string>

const char *updateStatusName(UpdateStatus status) {
  switch (status) {
  case UpdateStatus::BufferTooSmall:
    return "buffer too small";
  case UpdateStatus::IntervalNotReached:
    return "interval not reached";
  case UpdateStatus::Updated:
    return "updated";
  }
  return "unknown";
}

UpdateScheduler::UpdateScheduler(DualReplayBuffer &replayBuffer_,
                                 UpdateFunction updateFunc_, size_t batchSize_,
                                 size_t nTimesUpdate_, size_t replayStartSize_,
                                 int64_t updateInterval_, bool verbose_)
    : replayBuffer(replayBuffer_), updateFunc(std::move(updateFunc_)),
      batchSize(batchSize_), nTimesUpdate(nTimesUpdate_),
      replayStartSize(replayStartSize_), updateInterval(updateInterval_),
      verbose(verbose_) {
  if (batchSize > replayStartSize) {
    throw ConfigurationError("minibatch size " + std::to_string(batchSize) +
                             " exceeds the replay start size " +
                             std::to_string(replayStartSize));
  }
  if (batchSize == 0) {
    throw ConfigurationError("minibatch size must be positive");
  }
  if (updateInterval <= 0) {
    throw ConfigurationError("update interval must be positive");
  }
  if (!updateFunc) {
    throw ConfigurationError("update scheduler needs an update function");
  }
}

void UpdateScheduler::reportFill(size_t size) {
  if (!verbose) {
    return;
  }
  if (size < replayStartSize) {
    if (size / REPLAY_BUFFER_ADD_PRINT_SIZE !=
        lastReportedSize / REPLAY_BUFFER_ADD_PRINT_SIZE) {
      std::cout << "Waiting for the replay buffer to fill up. "
                << "It currently has " << size;
      std::cout << " elements, waiting for at least " << replayStartSize
                << " elements" << std::endl;
    }
    lastReportedSize = size;
  } else if (!started) {
    std::cout << "Replay buffer filled up. "
              << "It currently has " << size << " elements.";
    std::cout << " Start training." << std::endl;
  }
}

UpdateStatus UpdateScheduler::updateIfNecessary(int64_t iteration) {
  auto size = replayBuffer.size();
  reportFill(size);
  if (size < replayStartSize) {
    return UpdateStatus::BufferTooSmall;
  }
  started = true;

  if (iteration % updateInterval != 0) {
    return UpdateStatus::IntervalNotReached;
  }

  for (size_t i = 0; i < nTimesUpdate; i++) {
    auto sampled = replayBuffer.sample(batchSize);
    updateFunc(sampled.agent, sampled.demo);
    updateCount++;
  }
  return UpdateStatus::Updated;
}

void UpdateScheduler::updateFromDemonstrations() {
  auto sampled = replayBuffer.sample(batchSize, true);
  std::vector<Experience> noAgent;
  updateFunc(noAgent, sampled.demo);
  updateCount++;
}
