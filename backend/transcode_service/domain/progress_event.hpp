#pragma once

#include "video.hpp"

#include <optional>
#include <string>

namespace transcode_service {

struct ProgressEvent {
  std::string job_id;
  VideoStatus status{VideoStatus::Processing};
  int percent{0};
  std::optional<int> current_stage_index;  // 1-based
  std::optional<int> total_stages;
  std::optional<int> current_rendition;    // target height
  std::optional<std::string> message;
  TimePoint timestamp;
};

} // namespace transcode_service
