#include "rendition_ladder.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace transcode_service {

std::vector<int> selectLadder(int source_height) {
  std::vector<int> ladder;
  for (int height : kStandardHeights) {
    if (height <= source_height) {
      ladder.push_back(height);
    }
  }
  if (ladder.empty()) {
    ladder.push_back(source_height);
  }
  return ladder;
}

int64_t estimateBandwidth(int height) {
  switch (height) {
    case 2160: return 8000000;
    case 1440: return 6000000;
    case 1080: return 5000000;
    case 720: return 2800000;
    case 480: return 1400000;
    case 360: return 800000;
    case 240: return 500000;
    case 144: return 300000;
    default: return static_cast<int64_t>(height) * 2500;
  }
}

int audioBitrateKbps(int height) {
  if (height >= 1080) return 192;
  if (height >= 720) return 160;
  if (height >= 480) return 128;
  return 96;
}

std::string renditionLabel(int height) {
  return std::to_string(height) + "p";
}

int scaledWidth(int source_width, int source_height, int height) {
  if (source_width <= 0 || source_height <= 0) {
    // 未知宽高按16:9处理
    source_width = 16;
    source_height = 9;
  }
  double exact = static_cast<double>(source_width) * height / source_height;
  int width = static_cast<int>(std::lround(exact / 2.0)) * 2;
  return std::max(width, 2);
}

std::vector<RenditionSpec> makeRenditionSpecs(int source_width, int source_height) {
  std::vector<RenditionSpec> specs;
  for (int height : selectLadder(source_height)) {
    specs.push_back(RenditionSpec{
      .height = height,
      .width = scaledWidth(source_width, source_height, height),
      .label = renditionLabel(height),
      .audio_bitrate_kbps = audioBitrateKbps(height),
      .bandwidth = estimateBandwidth(height)
    });
  }
  return specs;
}

std::string buildMasterManifest(std::vector<RenditionSpec> renditions) {
  std::stable_sort(renditions.begin(), renditions.end(), [](const RenditionSpec& a, const RenditionSpec& b) {
    if (a.bandwidth != b.bandwidth) return a.bandwidth > b.bandwidth;
    return a.height > b.height;
  });

  std::string manifest = "#EXTM3U\n#EXT-X-VERSION:3\n";
  for (const auto& r : renditions) {
    manifest += std::format("#EXT-X-STREAM-INF:BANDWIDTH={},RESOLUTION={}x{},NAME=\"{}\"\n",
                            r.bandwidth, r.width, r.height, r.label);
    manifest += r.label + "/playlist.m3u8\n";
  }
  return manifest;
}

} // namespace transcode_service
