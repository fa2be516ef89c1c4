#pragma once

#include "domain/progress_bus.hpp"

#include <mutex>
#include <string>

namespace transcode_service {

/*
  Publishes the events of one job. Non-terminal percents never go below the
  last published value; terminal events pass through unchanged.
  Safe to call from the tick forwarding thread and the processing thread.
*/
class ProgressTracker {
public:
  ProgressTracker(ProgressBus& bus, std::string job_id) : bus_(bus), job_id_(std::move(job_id)) {}

  common::Result<void> publish(ProgressEvent event);

  int lastPercent() const;

private:
  ProgressBus& bus_;
  std::string job_id_;
  mutable std::mutex mtx_;
  int last_percent_{0};
};

} // namespace transcode_service
