#include "progress_tracker.hpp"

#include <algorithm>

namespace transcode_service {

common::Result<void> ProgressTracker::publish(ProgressEvent event) {
  std::lock_guard<std::mutex> lock{mtx_};
  event.job_id = job_id_;
  if (!isTerminal(event.status)) {
    event.percent = std::clamp(event.percent, last_percent_, 100);
  }
  if (event.timestamp == TimePoint{}) {
    event.timestamp = Clock::now();
  }
  last_percent_ = event.percent;
  // 持锁发布, 保证同一任务的事件顺序
  return bus_.publish(event);
}

int ProgressTracker::lastPercent() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return last_percent_;
}

} // namespace transcode_service
