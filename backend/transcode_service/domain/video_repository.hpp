#pragma once

#include "common/error.hpp"
#include "video.hpp"

#include <optional>
#include <string>
#include <vector>

namespace transcode_service {

class VideoRepository {
public:
  virtual ~VideoRepository() = default;

  // insert, or reset an existing row back to waiting
  virtual common::Result<void> createAsset(const VideoAsset& asset) = 0;
  virtual common::Result<std::optional<VideoAsset>> findById(const std::string& id) = 0;
  virtual common::Result<std::vector<VideoAsset>> listAssets(size_t limit) = 0;

  // processing clears error_message, failed sets it
  virtual common::Result<void> updateStatus(const std::string& id,
                                            VideoStatus status,
                                            const std::optional<std::string>& error_message) = 0;
  virtual common::Result<void> updateProbe(const std::string& id, int width, int height, double duration_seconds) = 0;
  virtual common::Result<void> setMasterManifest(const std::string& id,
                                                 const std::string& location,
                                                 const std::string& url) = 0;
  virtual common::Result<void> markCompleted(const std::string& id, TimePoint completed_at) = 0;

  // keyed by (video_id, label)
  virtual common::Result<void> upsertRendition(const Rendition& rendition) = 0;
  virtual common::Result<std::vector<Rendition>> listRenditions(const std::string& video_id) = 0;
};

} // namespace transcode_service
