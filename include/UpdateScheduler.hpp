#ifndef UPDATE_SCHEDULER_HPP
#define UPDATE_SCHEDULER_HPP

#include "DualReplayBuffer.hpp"
#include <functional>
#include <vector>

enum class UpdateStatus { BufferTooSmall, IntervalNotReached, Updated };

const char *updateStatusName(UpdateStatus status);

// Decides when a training update fires and hands it freshly sampled
// agent-origin and demo-origin experiences.
class UpdateScheduler {
public:
  using UpdateFunction = std::function<void(std::vector<Experience> &,
                                            std::vector<Experience> &)>;

  UpdateScheduler(DualReplayBuffer &replayBuffer_, UpdateFunction updateFunc_,
                  size_t batchSize_, size_t nTimesUpdate_,
                  size_t replayStartSize_, int64_t updateInterval_,
                  bool verbose_ = true);

  // Called once per environment step during normal play.
  UpdateStatus updateIfNecessary(int64_t iteration);

  // One update on a demonstration-only batch, used for pretraining.
  void updateFromDemonstrations();

  size_t getBatchSize() const { return batchSize; }
  size_t getUpdateCount() const { return updateCount; }

private:
  void reportFill(size_t size);

  DualReplayBuffer &replayBuffer;
  UpdateFunction updateFunc;
  size_t batchSize;
  size_t nTimesUpdate;
  size_t replayStartSize;
  int64_t updateInterval;
  bool verbose;

  size_t updateCount = 0;
  size_t lastReportedSize = 0;
  bool started = false;
};

#endif // UPDATE_SCHEDULER_HPP
