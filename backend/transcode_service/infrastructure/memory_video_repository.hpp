#pragma once

#include "domain/video_repository.hpp"

#include <map>
#include <mutex>
#include <utility>

namespace transcode_service {

// Rejects the status changes the worker never makes, so misuse surfaces as Persistence errors.
class MemoryVideoRepository : public VideoRepository {
public:
  common::Result<void> createAsset(const VideoAsset& asset) override;
  common::Result<std::optional<VideoAsset>> findById(const std::string& id) override;
  common::Result<std::vector<VideoAsset>> listAssets(size_t limit) override;
  common::Result<void> updateStatus(const std::string& id,
                                    VideoStatus status,
                                    const std::optional<std::string>& error_message) override;
  common::Result<void> updateProbe(const std::string& id, int width, int height, double duration_seconds) override;
  common::Result<void> setMasterManifest(const std::string& id,
                                         const std::string& location,
                                         const std::string& url) override;
  common::Result<void> markCompleted(const std::string& id, TimePoint completed_at) override;
  common::Result<void> upsertRendition(const Rendition& rendition) override;
  common::Result<std::vector<Rendition>> listRenditions(const std::string& video_id) override;

  // every status an asset went through, in order
  std::vector<VideoStatus> statusHistory(const std::string& id) const;

private:
  common::Result<VideoAsset*> find(const std::string& id);

  mutable std::mutex mtx_;
  std::map<std::string, VideoAsset> assets_;
  std::map<std::string, std::vector<VideoStatus>> history_;
  std::map<std::pair<std::string, std::string>, Rendition> renditions_;
};

} // namespace transcode_service
