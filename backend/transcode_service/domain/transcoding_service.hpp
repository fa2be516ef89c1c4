#pragma once

#include "common/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace transcode_service {

struct ProbeResult {
  int width{0};
  int height{0};
  double duration_seconds{0.0};
  int64_t bitrate{0};
};

struct RenditionSpec {
  int height{0};
  int width{0};  // even, keeps the source aspect ratio
  std::string label;
  int audio_bitrate_kbps{0};
  int64_t bandwidth{0};
};

struct ArtifactFile {
  std::filesystem::path path;
  std::string name;          // file name inside the rendition directory
  std::string content_type;
};

struct RenditionArtifacts {
  std::filesystem::path directory;
  std::vector<ArtifactFile> segments;
  ArtifactFile playlist;
};

// one raw progress report from the encoder
struct TranscodeTick {
  double out_time_seconds{0.0};
  int64_t frame{0};
  std::optional<double> speed;
};

struct TranscodeControl {
  std::stop_token stop;
  std::optional<std::chrono::steady_clock::time_point> deadline;
};

using TickSink = std::function<void(const TranscodeTick&)>;

class TranscodingService {
public:
  virtual ~TranscodingService() = default;

  virtual common::Result<ProbeResult> probe(const std::string& source_location) = 0;

  // Writes segments and playlist.m3u8 into work_dir. Ticks are delivered on the calling thread.
  virtual common::Result<RenditionArtifacts> transcode(const std::string& source_location,
                                                       const RenditionSpec& spec,
                                                       const std::filesystem::path& work_dir,
                                                       const TickSink& on_tick,
                                                       const TranscodeControl& control) = 0;
};

} // namespace transcode_service
