#include "serialization.hpp"

#include <nlohmann/json.hpp>

namespace transcode_service {

using nlohmann::json;

int64_t toUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromUnixMillis(int64_t ms) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

EntryFields encodeJobEntry(const VideoJob& job, TimePoint enqueued_at) {
  json payload = {
    {"job_id", job.job_id},
    {"source_location", job.source_location},
    {"original_name", job.original_name}
  };
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(enqueued_at.time_since_epoch()).count();
  return {
    {"job_id", job.job_id},
    {"source_location", job.source_location},
    {"original_name", job.original_name},
    {"payload", payload.dump()},
    {"enqueued_at", std::to_string(seconds)}
  };
}

common::Result<VideoJob> decodeJobEntry(const QueueEntry& entry) {
  const auto* payload = entry.field("payload");
  if (payload == nullptr) {
    return common::fail(common::ErrorKind::Malformed, "entry " + entry.id + " has no payload");
  }

  json doc = json::parse(*payload, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return common::fail(common::ErrorKind::Malformed, "entry " + entry.id + " payload is not a JSON object");
  }

  auto text = [&doc](const char* name) -> std::string {
    auto it = doc.find(name);
    if (it == doc.end() || !it->is_string()) return {};
    return it->get<std::string>();
  };

  VideoJob job{
    .job_id = text("job_id"),
    .source_location = text("source_location"),
    .original_name = text("original_name")
  };
  if (job.job_id.empty() || job.source_location.empty()) {
    return common::fail(common::ErrorKind::Malformed, "entry " + entry.id + " payload lacks job_id or source_location");
  }
  if (!isValidJobId(job.job_id)) {
    return common::fail(common::ErrorKind::Malformed, "entry " + entry.id + " has invalid job_id " + job.job_id);
  }
  return job;
}

std::string encodeProgress(const ProgressEvent& event) {
  json doc = {
    {"job_id", event.job_id},
    {"status", std::string(toString(event.status))},
    {"percent", event.percent},
    {"timestamp", toUnixMillis(event.timestamp)}
  };
  if (event.current_stage_index) doc["current_stage_index"] = *event.current_stage_index;
  if (event.total_stages) doc["total_stages"] = *event.total_stages;
  if (event.current_rendition) doc["current_rendition"] = *event.current_rendition;
  if (event.message) doc["message"] = *event.message;
  return doc.dump();
}

common::Result<ProgressEvent> decodeProgress(const std::string& text) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return common::fail(common::ErrorKind::Malformed, "progress message is not a JSON object");
  }

  try {
    auto status = parseVideoStatus(doc.at("status").get<std::string>());
    if (!status) {
      return common::fail(common::ErrorKind::Malformed, "unknown status in progress message");
    }

    ProgressEvent event;
    event.job_id = doc.at("job_id").get<std::string>();
    event.status = *status;
    event.percent = doc.at("percent").get<int>();
    event.timestamp = fromUnixMillis(doc.value("timestamp", int64_t{0}));
    if (doc.contains("current_stage_index")) event.current_stage_index = doc["current_stage_index"].get<int>();
    if (doc.contains("total_stages")) event.total_stages = doc["total_stages"].get<int>();
    if (doc.contains("current_rendition")) event.current_rendition = doc["current_rendition"].get<int>();
    if (doc.contains("message")) event.message = doc["message"].get<std::string>();
    return event;
  } catch (const json::exception& e) {
    return common::fail(common::ErrorKind::Malformed, std::string("bad progress message: ") + e.what());
  }
}

} // namespace transcode_service
