#pragma once

#include "domain/transcoding_service.hpp"
#include "infrastructure/memory_video_repository.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace transcode_service::fakes {

// Writes a few small segment files and a playlist instead of running an encoder.
class FakeTranscoder : public TranscodingService {
public:
  explicit FakeTranscoder(ProbeResult probe = {.width = 1920, .height = 1080, .duration_seconds = 30.0, .bitrate = 4000000})
    : probe_(probe) {}

  common::Result<ProbeResult> probe(const std::string& source_location) override {
    if (fail_probe) {
      return common::fail(common::ErrorKind::Probe, "could not open input: " + source_location);
    }
    return probe_;
  }

  common::Result<RenditionArtifacts> transcode(const std::string& /* source_location */,
                                               const RenditionSpec& spec,
                                               const std::filesystem::path& work_dir,
                                               const TickSink& on_tick,
                                               const TranscodeControl& control) override {
    {
      std::lock_guard<std::mutex> lock{mtx_};
      calls_.push_back(spec.height);
    }
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    if (control.stop.stop_requested()) {
      return common::fail(common::ErrorKind::Cancelled, "stopped");
    }
    if (fail_heights.contains(spec.height)) {
      return common::fail(common::ErrorKind::Transcode, "ffmpeg exited with code 1: encoder error");
    }

    for (double fraction : {0.25, 0.5, 0.75}) {
      if (on_tick) {
        on_tick(TranscodeTick{.out_time_seconds = probe_.duration_seconds * fraction, .frame = 100});
      }
    }

    RenditionArtifacts artifacts{.directory = work_dir};
    for (int i = 0; i < segments_per_rendition; ++i) {
      auto name = "segment_00" + std::to_string(i) + ".ts";
      std::ofstream(work_dir / name, std::ios::binary) << "ts-data-" << spec.label << "-" << i;
      artifacts.segments.push_back(ArtifactFile{work_dir / name, name, "video/mp2t"});
    }
    std::ofstream(work_dir / "playlist.m3u8") << "#EXTM3U\n#EXT-X-ENDLIST\n";
    artifacts.playlist = ArtifactFile{work_dir / "playlist.m3u8", "playlist.m3u8", "application/vnd.apple.mpegurl"};
    return artifacts;
  }

  std::vector<int> calls() const {
    std::lock_guard<std::mutex> lock{mtx_};
    return calls_;
  }

  bool fail_probe{false};
  std::set<int> fail_heights;
  int segments_per_rendition{2};
  std::chrono::milliseconds delay{0};

private:
  ProbeResult probe_;
  mutable std::mutex mtx_;
  std::vector<int> calls_;
};

// Rendition upserts fail while the flag is set.
class FlakyVideoRepository : public MemoryVideoRepository {
public:
  common::Result<void> upsertRendition(const Rendition& rendition) override {
    if (fail_renditions) {
      return common::fail(common::ErrorKind::Persistence, "deadlock found when trying to get lock");
    }
    return MemoryVideoRepository::upsertRendition(rendition);
  }

  std::atomic<bool> fail_renditions{false};
};

// unique directory under /tmp, removed on destruction
class TempDir {
public:
  explicit TempDir(const std::string& name) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            (name + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace transcode_service::fakes
