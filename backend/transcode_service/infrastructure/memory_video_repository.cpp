#include "memory_video_repository.hpp"

#include <algorithm>

namespace transcode_service {

common::Result<VideoAsset*> MemoryVideoRepository::find(const std::string& id) {
  auto it = assets_.find(id);
  if (it == assets_.end()) {
    return common::fail(common::ErrorKind::Persistence, "video " + id + " not found");
  }
  return &it->second;
}

common::Result<void> MemoryVideoRepository::createAsset(const VideoAsset& asset) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto& stored = assets_[asset.id];
  stored = asset;
  stored.status = VideoStatus::Waiting;
  stored.error_message.reset();
  stored.completed_at.reset();
  history_[asset.id].push_back(VideoStatus::Waiting);
  return {};
}

common::Result<std::optional<VideoAsset>> MemoryVideoRepository::findById(const std::string& id) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = assets_.find(id);
  if (it == assets_.end()) {
    return std::optional<VideoAsset>{};
  }
  return std::optional<VideoAsset>{it->second};
}

common::Result<std::vector<VideoAsset>> MemoryVideoRepository::listAssets(size_t limit) {
  std::lock_guard<std::mutex> lock{mtx_};
  std::vector<VideoAsset> result;
  for (const auto& [id, asset] : assets_) {
    result.push_back(asset);
  }
  std::sort(result.begin(), result.end(), [](const VideoAsset& a, const VideoAsset& b) {
    return a.created_at > b.created_at;
  });
  if (result.size() > limit) {
    result.resize(limit);
  }
  return result;
}

common::Result<void> MemoryVideoRepository::updateStatus(const std::string& id,
                                                         VideoStatus status,
                                                         const std::optional<std::string>& error_message) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto asset = find(id);
  if (!asset) return std::unexpected(asset.error());

  auto* row = *asset;
  if (!canTransition(row->status, status)) {
    return common::fail(common::ErrorKind::Persistence,
                        std::string("illegal transition ") + std::string(toString(row->status)) + " -> " + std::string(toString(status)));
  }
  row->status = status;
  row->error_message = status == VideoStatus::Failed ? error_message : std::nullopt;
  if (status != VideoStatus::Completed) {
    row->completed_at.reset();
  }
  row->updated_at = Clock::now();
  history_[id].push_back(status);
  return {};
}

common::Result<void> MemoryVideoRepository::updateProbe(const std::string& id, int width, int height, double duration_seconds) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto asset = find(id);
  if (!asset) return std::unexpected(asset.error());
  (*asset)->source_width = width;
  (*asset)->source_height = height;
  (*asset)->duration_seconds = duration_seconds;
  (*asset)->updated_at = Clock::now();
  return {};
}

common::Result<void> MemoryVideoRepository::setMasterManifest(const std::string& id,
                                                              const std::string& location,
                                                              const std::string& url) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto asset = find(id);
  if (!asset) return std::unexpected(asset.error());
  (*asset)->master_manifest_location = location;
  (*asset)->master_manifest_url = url;
  (*asset)->updated_at = Clock::now();
  return {};
}

common::Result<void> MemoryVideoRepository::markCompleted(const std::string& id, TimePoint completed_at) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto asset = find(id);
  if (!asset) return std::unexpected(asset.error());

  auto* row = *asset;
  if (!canTransition(row->status, VideoStatus::Completed)) {
    return common::fail(common::ErrorKind::Persistence,
                        std::string("illegal transition ") + std::string(toString(row->status)) + " -> completed");
  }
  row->status = VideoStatus::Completed;
  row->error_message.reset();
  row->completed_at = completed_at;
  row->updated_at = Clock::now();
  history_[id].push_back(VideoStatus::Completed);
  return {};
}

common::Result<void> MemoryVideoRepository::upsertRendition(const Rendition& rendition) {
  std::lock_guard<std::mutex> lock{mtx_};
  if (!assets_.contains(rendition.video_id)) {
    return common::fail(common::ErrorKind::Persistence, "video " + rendition.video_id + " not found");
  }
  auto key = std::make_pair(rendition.video_id, rendition.label);
  auto it = renditions_.find(key);
  if (it == renditions_.end()) {
    renditions_.emplace(key, rendition);
  } else {
    auto id = it->second.id;
    it->second = rendition;
    it->second.id = id;
  }
  return {};
}

common::Result<std::vector<Rendition>> MemoryVideoRepository::listRenditions(const std::string& video_id) {
  std::lock_guard<std::mutex> lock{mtx_};
  std::vector<Rendition> result;
  for (const auto& [key, rendition] : renditions_) {
    if (key.first == video_id) {
      result.push_back(rendition);
    }
  }
  std::sort(result.begin(), result.end(), [](const Rendition& a, const Rendition& b) {
    return a.height > b.height;
  });
  return result;
}

std::vector<VideoStatus> MemoryVideoRepository::statusHistory(const std::string& id) const {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = history_.find(id);
  if (it == history_.end()) return {};
  return it->second;
}

} // namespace transcode_service
