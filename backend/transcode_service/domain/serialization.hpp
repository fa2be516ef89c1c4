#pragma once

#include "common/error.hpp"
#include "job_queue.hpp"
#include "progress_event.hpp"
#include "video.hpp"

#include <string>

namespace transcode_service {

EntryFields encodeJobEntry(const VideoJob& job, TimePoint enqueued_at);

// Malformed when the payload is missing, not JSON, or lacks job_id/source_location
common::Result<VideoJob> decodeJobEntry(const QueueEntry& entry);

std::string encodeProgress(const ProgressEvent& event);
common::Result<ProgressEvent> decodeProgress(const std::string& text);

int64_t toUnixMillis(TimePoint tp);
TimePoint fromUnixMillis(int64_t ms);

} // namespace transcode_service
