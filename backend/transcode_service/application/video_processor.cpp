#include "video_processor.hpp"
#include "common/channel.hpp"
#include "common/uuid.hpp"
#include "rendition_ladder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <functional>
#include <sstream>
#include <thread>

namespace transcode_service {

namespace {

constexpr const char* kManifestContentType = "application/vnd.apple.mpegurl";

// 转码进度转发线程: 转码器在调用线程上回调, 这里通过通道交给独立线程发布
class TickForwarder {
public:
  explicit TickForwarder(std::function<void(const TranscodeTick&)> handler)
    : ticks_(std::make_shared<common::Channel<TranscodeTick>>()),
      thread_([ticks = ticks_, handler = std::move(handler)]() {
        while (true) {
          if (auto tick = ticks->pop(std::chrono::milliseconds(250))) {
            handler(*tick);
            continue;
          }
          if (ticks->drained()) break;
        }
      }) {}

  ~TickForwarder() { finish(); }

  TickForwarder(const TickForwarder&) = delete;
  TickForwarder& operator=(const TickForwarder&) = delete;

  void push(const TranscodeTick& tick) { ticks_->push(tick); }

  // drains what is queued, then joins
  void finish() {
    ticks_->close();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

private:
  std::shared_ptr<common::Channel<TranscodeTick>> ticks_;
  std::jthread thread_;
};

class WorkDirGuard {
public:
  explicit WorkDirGuard(std::filesystem::path dir) : dir_(std::move(dir)) {}
  ~WorkDirGuard() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
    if (ec) {
      spdlog::warn("could not remove work directory {}: {}", dir_.string(), ec.message());
    }
  }

  WorkDirGuard(const WorkDirGuard&) = delete;
  WorkDirGuard& operator=(const WorkDirGuard&) = delete;

private:
  std::filesystem::path dir_;
};

int stagePercent(size_t index, double fraction, size_t total) {
  return 5 + static_cast<int>(std::floor((static_cast<double>(index) + fraction) * 90.0 / static_cast<double>(total)));
}

std::string stageMessage(const RenditionSpec& spec, size_t index, size_t total) {
  return std::format("Processing {} ({}/{})...", spec.label, index + 1, total);
}

} // namespace

std::string artifactKey(const std::string& job_id, const std::string& label, const std::string& file_name) {
  return job_id + "/processed/" + label + "/" + file_name;
}

std::string masterManifestKey(const std::string& job_id) {
  return job_id + "/processed/master.m3u8";
}

VideoProcessor::VideoProcessor(std::shared_ptr<TranscodingService> transcoder,
                               std::shared_ptr<ObjectStore> store,
                               std::shared_ptr<VideoRepository> repository,
                               std::shared_ptr<ProgressBus> progress,
                               ProcessorOptions options)
  : transcoder_(std::move(transcoder)),
    store_(std::move(store)),
    repository_(std::move(repository)),
    progress_(std::move(progress)),
    options_(std::move(options)) {}

ProcessingReport VideoProcessor::process(const VideoJob& job, std::stop_token abort) {
  ProcessingReport report{.job_id = job.job_id};
  ProgressTracker tracker(*progress_, job.job_id);
  const auto deadline = std::chrono::steady_clock::now() + options_.job_timeout;

  spdlog::info("[>] processing job {} source={}", job.job_id, job.source_location);

  transition(report, VideoStatus::Processing, std::nullopt);
  bestEffort(report, "publish progress", tracker.publish({
    .status = VideoStatus::Processing,
    .percent = 0,
    .message = "Starting video processing..."
  }));

  auto probe = transcoder_->probe(job.source_location);
  if (!probe) {
    failJob(report, tracker,
            common::Error{common::ErrorKind::Probe, "failed to read video metadata: " + probe.error().message}, 0);
    return report;
  }
  spdlog::info("[i] job {} source {}x{}, duration {:.2f}s",
               job.job_id, probe->width, probe->height, probe->duration_seconds);

  bestEffort(report, "update probe",
             repository_->updateProbe(job.job_id, probe->width, probe->height, probe->duration_seconds));

  const auto specs = makeRenditionSpecs(probe->width, probe->height);
  const size_t total = specs.size();
  spdlog::info("[i] job {} generating {} renditions", job.job_id, total);

  bestEffort(report, "publish progress", tracker.publish({
    .status = VideoStatus::Processing,
    .percent = 5,
    .total_stages = static_cast<int>(total),
    .message = std::format("Processing {} renditions...", total)
  }));

  for (size_t i = 0; i < specs.size(); ++i) {
    const auto& spec = specs[i];

    bestEffort(report, "publish progress", tracker.publish({
      .status = VideoStatus::Processing,
      .percent = stagePercent(i, 0.0, total),
      .current_stage_index = static_cast<int>(i + 1),
      .total_stages = static_cast<int>(total),
      .current_rendition = spec.height,
      .message = stageMessage(spec, i, total)
    }));

    common::Result<Rendition> rendition = common::fail(common::ErrorKind::Cancelled, "cancelled");
    if (std::chrono::steady_clock::now() >= deadline) {
      rendition = common::fail(common::ErrorKind::Timeout,
                               std::format("job exceeded {}s", options_.job_timeout.count()));
    } else if (!abort.stop_requested()) {
      RenditionContext ctx{
        .job = job,
        .spec = spec,
        .index = i,
        .total = total,
        .duration_seconds = probe->duration_seconds,
        .control = TranscodeControl{.stop = abort, .deadline = deadline}
      };
      rendition = processRendition(ctx, tracker, report);
    }

    if (!rendition) {
      failJob(report, tracker,
              common::Error{rendition.error().kind,
                            "failed to transcode " + spec.label + ": " + rendition.error().message},
              tracker.lastPercent());
      return report;
    }

    report.renditions.push_back(std::move(*rendition));
    spdlog::info("[√] job {} completed {}", job.job_id, spec.label);
  }

  const auto manifest = buildMasterManifest(specs);
  std::istringstream manifest_stream(manifest);
  auto location = store_->put(manifest_stream, static_cast<int64_t>(manifest.size()),
                              masterManifestKey(job.job_id), kManifestContentType);
  if (!location) {
    failJob(report, tracker,
            common::Error{location.error().kind, "failed to upload master manifest: " + location.error().message},
            tracker.lastPercent());
    return report;
  }
  report.master_manifest_location = *location;

  std::string url;
  if (auto public_url = store_->publicUrl(*location)) {
    url = *public_url;
  } else {
    report.best_effort_failures.push_back({"master manifest url", public_url.error()});
    spdlog::warn("job {}: master manifest url: {}", job.job_id, public_url.error().describe());
  }
  bestEffort(report, "set master manifest", repository_->setMasterManifest(job.job_id, *location, url));

  if (!canTransition(report.status, VideoStatus::Completed)) {
    spdlog::warn("job {}: unexpected transition {} -> completed", job.job_id, toString(report.status));
  }
  report.status = VideoStatus::Completed;
  bestEffort(report, "mark completed", repository_->markCompleted(job.job_id, Clock::now()));

  bestEffort(report, "publish progress", tracker.publish({
    .status = VideoStatus::Completed,
    .percent = 100,
    .message = "Processing completed successfully!"
  }));

  spdlog::info("[√] job {} all renditions completed", job.job_id);
  return report;
}

common::Result<Rendition> VideoProcessor::processRendition(const RenditionContext& ctx,
                                                           ProgressTracker& tracker,
                                                           ProcessingReport& report) {
  const auto& job = ctx.job;
  const auto& spec = ctx.spec;

  const auto work_dir = options_.work_root / std::format("vodpipe-{}-{}", job.job_id, spec.label);
  std::error_code ec;
  std::filesystem::remove_all(work_dir, ec);
  std::filesystem::create_directories(work_dir, ec);
  if (ec) {
    return common::fail(common::ErrorKind::Transcode, "cannot create work directory " + work_dir.string() + ": " + ec.message());
  }
  WorkDirGuard work_dir_guard(work_dir);

  common::Result<RenditionArtifacts> artifacts = common::fail(common::ErrorKind::Transcode, "not started");
  {
    TickForwarder forwarder([&tracker, &ctx](const TranscodeTick& tick) {
      double fraction = 0.0;
      if (ctx.duration_seconds > 0.0) {
        fraction = std::clamp(tick.out_time_seconds / ctx.duration_seconds, 0.0, 0.999);
      }
      auto published = tracker.publish({
        .status = VideoStatus::Processing,
        .percent = stagePercent(ctx.index, fraction, ctx.total),
        .current_stage_index = static_cast<int>(ctx.index + 1),
        .total_stages = static_cast<int>(ctx.total),
        .current_rendition = ctx.spec.height,
        .message = stageMessage(ctx.spec, ctx.index, ctx.total)
      });
      if (!published) {
        spdlog::debug("job {}: dropped progress tick: {}", ctx.job.job_id, published.error().describe());
      }
    });

    artifacts = transcoder_->transcode(job.source_location, spec, work_dir,
                                       [&forwarder](const TranscodeTick& tick) { forwarder.push(tick); },
                                       ctx.control);
  }
  if (!artifacts) {
    return std::unexpected(artifacts.error());
  }

  int64_t size_bytes = 0;
  for (const auto& segment : artifacts->segments) {
    auto uploaded = uploadFile(segment.path, artifactKey(job.job_id, spec.label, segment.name), segment.content_type);
    if (!uploaded) {
      return std::unexpected(uploaded.error());
    }
    size_bytes += static_cast<int64_t>(std::filesystem::file_size(segment.path, ec));
  }

  const auto& playlist = artifacts->playlist;
  auto playlist_location = uploadFile(playlist.path, artifactKey(job.job_id, spec.label, playlist.name), playlist.content_type);
  if (!playlist_location) {
    return std::unexpected(playlist_location.error());
  }
  size_bytes += static_cast<int64_t>(std::filesystem::file_size(playlist.path, ec));

  std::string url;
  if (auto public_url = store_->publicUrl(*playlist_location)) {
    url = *public_url;
  } else {
    report.best_effort_failures.push_back({"rendition url", public_url.error()});
    spdlog::warn("job {}: {} url: {}", job.job_id, spec.label, public_url.error().describe());
  }

  Rendition rendition{
    .id = common::generateUuid(),
    .video_id = job.job_id,
    .label = spec.label,
    .height = spec.height,
    .artifact_location = *playlist_location,
    .artifact_url = url,
    .segment_count = static_cast<int>(artifacts->segments.size()),
    .size_bytes = size_bytes,
    .bandwidth_estimate = spec.bandwidth,
    .processed_at = Clock::now()
  };
  bestEffort(report, "upsert rendition", repository_->upsertRendition(rendition));
  return rendition;
}

common::Result<std::string> VideoProcessor::uploadFile(const std::filesystem::path& path,
                                                       const std::string& key,
                                                       const std::string& content_type) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return common::fail(common::ErrorKind::Store, "cannot stat " + path.string() + ": " + ec.message());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::fail(common::ErrorKind::Store, "cannot open " + path.string());
  }
  return store_->put(in, static_cast<int64_t>(size), key, content_type);
}

void VideoProcessor::transition(ProcessingReport& report, VideoStatus to, const std::optional<std::string>& error_message) {
  if (!canTransition(report.status, to)) {
    spdlog::warn("job {}: unexpected transition {} -> {}", report.job_id, toString(report.status), toString(to));
  }
  report.status = to;
  bestEffort(report, "update status", repository_->updateStatus(report.job_id, to, error_message));
}

void VideoProcessor::failJob(ProcessingReport& report, ProgressTracker& tracker, common::Error error, int percent) {
  spdlog::error("[!] job {} failed: {}", report.job_id, error.describe());
  transition(report, VideoStatus::Failed, error.message);
  bestEffort(report, "publish progress", tracker.publish({
    .status = VideoStatus::Failed,
    .percent = percent,
    .message = error.message
  }));
  report.error = std::move(error);
}

void VideoProcessor::bestEffort(ProcessingReport& report, const char* operation, const common::Result<void>& result) {
  if (result) return;
  spdlog::warn("job {}: {} failed: {}", report.job_id, operation, result.error().describe());
  report.best_effort_failures.push_back({operation, result.error()});
}

} // namespace transcode_service
