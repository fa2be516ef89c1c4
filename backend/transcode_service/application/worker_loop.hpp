#pragma once

#include "common/config/config.hpp"
#include "domain/job_queue.hpp"
#include "video_processor.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string_view>

namespace transcode_service {

enum class WorkerState {
  Startup,
  Recovering,
  Consuming,
  ShuttingDown,
  Stopped
};

constexpr std::string_view toString(WorkerState state) {
  switch (state) {
    case WorkerState::Startup: return "startup";
    case WorkerState::Recovering: return "recovering";
    case WorkerState::Consuming: return "consuming";
    case WorkerState::ShuttingDown: return "shutting_down";
    case WorkerState::Stopped: return "stopped";
  }
  return "unknown";
}

struct WorkerStats {
  uint64_t processed{0};
  uint64_t acknowledged{0};
  uint64_t failed{0};
  uint64_t poison{0};
  uint64_t recovered{0};
};

/*
  One consumer of the job group. Entries are acked only after the job completed,
  or when the payload can never be decoded. A failed job stays pending and is
  picked up again by the next recovery pass.
*/
class WorkerLoop {
public:
  WorkerLoop(std::shared_ptr<JobQueue> queue,
             std::shared_ptr<VideoProcessor> processor,
             config::QueueConfig cfg);

  // Returns once stop is requested and the entry in hand is finished.
  // abort is handed to the processor and kills a running transcode.
  void run(std::stop_token stop, std::stop_token abort = {});

  // Single recovery pass, returns the number of claimed entries.
  // Once stop is requested the remaining claimed entries are left pending.
  size_t recover(std::stop_token stop = {}, std::stop_token abort = {});

  WorkerState state() const { return state_.load(); }
  WorkerStats stats() const;

private:
  void handleEntry(const QueueEntry& entry, std::stop_token abort);
  void setState(WorkerState state);
  // true when interrupted by stop
  bool sleepFor(std::chrono::milliseconds duration, std::stop_token stop);

  std::shared_ptr<JobQueue> queue_;
  std::shared_ptr<VideoProcessor> processor_;
  config::QueueConfig cfg_;
  std::atomic<WorkerState> state_{WorkerState::Startup};
  mutable std::mutex stats_mtx_;
  WorkerStats stats_;
};

} // namespace transcode_service
