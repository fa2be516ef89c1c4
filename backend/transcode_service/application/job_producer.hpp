#pragma once

#include "domain/job_queue.hpp"
#include "domain/video.hpp"
#include "domain/video_repository.hpp"

#include <memory>
#include <optional>
#include <string>

namespace transcode_service {

class JobProducer {
public:
  JobProducer(std::shared_ptr<JobQueue> queue, std::shared_ptr<VideoRepository> repository)
    : queue_(std::move(queue)), repository_(std::move(repository)) {}

  // Creates the asset as waiting, then enqueues it. A new id is generated when job_id is empty.
  common::Result<VideoJob> submit(const std::string& source_location,
                                  const std::string& original_name,
                                  std::optional<std::string> job_id = std::nullopt);

private:
  std::shared_ptr<JobQueue> queue_;
  std::shared_ptr<VideoRepository> repository_;
};

} // namespace transcode_service
