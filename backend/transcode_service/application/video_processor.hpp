#pragma once

#include "domain/object_store.hpp"
#include "domain/progress_bus.hpp"
#include "domain/transcoding_service.hpp"
#include "domain/video.hpp"
#include "domain/video_repository.hpp"
#include "progress_tracker.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace transcode_service {

struct ProcessorOptions {
  std::filesystem::path work_root;
  std::chrono::seconds job_timeout{std::chrono::hours(2)};
};

// a write whose failure did not change the job outcome
struct BestEffortFailure {
  std::string operation;
  common::Error error;
};

struct ProcessingReport {
  std::string job_id;
  VideoStatus status{VideoStatus::Waiting};
  std::optional<common::Error> error;
  std::vector<Rendition> renditions;
  std::optional<std::string> master_manifest_location;
  std::vector<BestEffortFailure> best_effort_failures;

  bool succeeded() const { return status == VideoStatus::Completed; }
};

/*
  probe -> ladder -> transcode + upload each rendition -> master manifest -> completed.
  Any failure before the manifest is uploaded leaves the asset failed; partial
  artifacts are not removed. Every write is keyed by job id (and label), so a
  redelivered job can be processed again.
*/
class VideoProcessor {
public:
  VideoProcessor(std::shared_ptr<TranscodingService> transcoder,
                 std::shared_ptr<ObjectStore> store,
                 std::shared_ptr<VideoRepository> repository,
                 std::shared_ptr<ProgressBus> progress,
                 ProcessorOptions options);

  // abort kills a running transcode; the job then fails as Cancelled
  ProcessingReport process(const VideoJob& job, std::stop_token abort = {});

private:
  struct RenditionContext {
    const VideoJob& job;
    const RenditionSpec& spec;
    size_t index;
    size_t total;
    double duration_seconds;
    TranscodeControl control;
  };

  common::Result<Rendition> processRendition(const RenditionContext& ctx,
                                             ProgressTracker& tracker,
                                             ProcessingReport& report);

  common::Result<std::string> uploadFile(const std::filesystem::path& path,
                                         const std::string& key,
                                         const std::string& content_type);

  void transition(ProcessingReport& report, VideoStatus to, const std::optional<std::string>& error_message);
  void failJob(ProcessingReport& report, ProgressTracker& tracker, common::Error error, int percent);
  void bestEffort(ProcessingReport& report, const char* operation, const common::Result<void>& result);

  std::shared_ptr<TranscodingService> transcoder_;
  std::shared_ptr<ObjectStore> store_;
  std::shared_ptr<VideoRepository> repository_;
  std::shared_ptr<ProgressBus> progress_;
  ProcessorOptions options_;
};

// "<job_id>/processed/<label>/<file>"
std::string artifactKey(const std::string& job_id, const std::string& label, const std::string& file_name);
std::string masterManifestKey(const std::string& job_id);

} // namespace transcode_service
