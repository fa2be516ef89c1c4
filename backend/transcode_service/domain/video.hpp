#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace transcode_service {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class VideoStatus {
  Waiting,
  Processing,
  Completed,
  Failed
};

constexpr bool isTerminal(VideoStatus status) {
  return status == VideoStatus::Completed || status == VideoStatus::Failed;
}

constexpr std::string_view toString(VideoStatus status) {
  switch (status) {
    case VideoStatus::Waiting: return "waiting";
    case VideoStatus::Processing: return "processing";
    case VideoStatus::Completed: return "completed";
    case VideoStatus::Failed: return "failed";
  }
  return "waiting";
}

// "pending"是旧版本写入的waiting
constexpr std::optional<VideoStatus> parseVideoStatus(std::string_view text) {
  if (text == "waiting" || text == "pending") return VideoStatus::Waiting;
  if (text == "processing") return VideoStatus::Processing;
  if (text == "completed") return VideoStatus::Completed;
  if (text == "failed") return VideoStatus::Failed;
  return std::nullopt;
}

// Transitions the worker is allowed to make; redelivery may restart a terminal job.
constexpr bool canTransition(VideoStatus from, VideoStatus to) {
  switch (to) {
    case VideoStatus::Waiting: return false;
    case VideoStatus::Processing: return true;
    case VideoStatus::Completed:
    case VideoStatus::Failed: return from == VideoStatus::Processing;
  }
  return false;
}

// Job ids end up in object keys and progress topic names.
constexpr size_t kMaxJobIdLength = 128;

constexpr bool isValidJobId(std::string_view id) {
  if (id.empty() || id.size() > kMaxJobIdLength) return false;
  for (char c : id) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (!ok) return false;
  }
  return true;
}

// queue entry payload, immutable once enqueued
struct VideoJob {
  std::string job_id;
  std::string source_location;
  std::string original_name;
};

struct VideoAsset {
  std::string id;  // == job_id
  std::string original_name;
  std::string source_location;
  VideoStatus status{VideoStatus::Waiting};
  int source_width{0};
  int source_height{0};
  double duration_seconds{0.0};
  std::optional<std::string> error_message;
  TimePoint created_at;
  TimePoint updated_at;
  std::optional<TimePoint> completed_at;
  std::optional<std::string> master_manifest_location;
  std::optional<std::string> master_manifest_url;
};

struct Rendition {
  std::string id;
  std::string video_id;
  std::string label;  // "720p"
  int height{0};
  std::string artifact_location;  // object key of the rendition playlist
  std::string artifact_url;
  int segment_count{0};
  int64_t size_bytes{0};
  int64_t bandwidth_estimate{0};
  TimePoint processed_at;
};

} // namespace transcode_service
