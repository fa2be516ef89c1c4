#include "job_producer.hpp"
#include "common/uuid.hpp"
#include "domain/serialization.hpp"

#include <spdlog/spdlog.h>

namespace transcode_service {

common::Result<VideoJob> JobProducer::submit(const std::string& source_location,
                                             const std::string& original_name,
                                             std::optional<std::string> job_id) {
  if (source_location.empty()) {
    return common::fail(common::ErrorKind::Malformed, "source location is empty");
  }

  if (job_id && !job_id->empty() && !isValidJobId(*job_id)) {
    return common::fail(common::ErrorKind::Malformed,
                        "invalid job id '" + *job_id + "': letters, digits, '-' and '_' only");
  }

  VideoJob job{
    .job_id = job_id && !job_id->empty() ? *job_id : common::generateUuid(),
    .source_location = source_location,
    .original_name = original_name
  };

  const auto now = Clock::now();
  VideoAsset asset{
    .id = job.job_id,
    .original_name = job.original_name,
    .source_location = job.source_location,
    .status = VideoStatus::Waiting,
    .created_at = now,
    .updated_at = now
  };
  if (auto created = repository_->createAsset(asset); !created) {
    return std::unexpected(created.error());
  }

  auto entry_id = queue_->append(encodeJobEntry(job, now));
  if (!entry_id) {
    return std::unexpected(entry_id.error());
  }
  spdlog::info("[+] enqueued job {} as entry {}", job.job_id, *entry_id);
  return job;
}

} // namespace transcode_service
