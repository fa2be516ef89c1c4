#pragma once

#include "common/config/config.hpp"
#include "domain/transcoding_service.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transcode_service {

// libavformat for probing, an ffmpeg child process per rendition for HLS output
class FfmpegTranscoder : public TranscodingService {
public:
  explicit FfmpegTranscoder(config::TranscodeConfig cfg);

  common::Result<ProbeResult> probe(const std::string& source_location) override;

  common::Result<RenditionArtifacts> transcode(const std::string& source_location,
                                               const RenditionSpec& spec,
                                               const std::filesystem::path& work_dir,
                                               const TickSink& on_tick,
                                               const TranscodeControl& control) override;

  std::vector<std::string> buildArguments(const std::string& source_location,
                                          const RenditionSpec& spec,
                                          const std::filesystem::path& work_dir) const;

  static void setLogLevel(int loglevel);

private:
  config::TranscodeConfig cfg_;
};

// "frame=  240 fps=... time=00:00:08.00 ... speed=2.1x"; nullopt when the line carries no time
std::optional<TranscodeTick> parseProgressLine(std::string_view line);

// collects the segments and playlist an HLS run left in dir
common::Result<RenditionArtifacts> collectArtifacts(const std::filesystem::path& dir);

} // namespace transcode_service
