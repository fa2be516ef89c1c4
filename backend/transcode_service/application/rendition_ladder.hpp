#pragma once

#include "domain/transcoding_service.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace transcode_service {

inline constexpr std::array<int, 8> kStandardHeights{2160, 1440, 1080, 720, 480, 360, 240, 144};

// Standard rungs not taller than the source, descending; a single custom rung when none fits.
std::vector<int> selectLadder(int source_height);

int64_t estimateBandwidth(int height);
int audioBitrateKbps(int height);
std::string renditionLabel(int height);

// width for scale=-2:h, i.e. aspect preserving and even
int scaledWidth(int source_width, int source_height, int height);

std::vector<RenditionSpec> makeRenditionSpecs(int source_width, int source_height);

// HLS master playlist, variants ordered by bandwidth then height, both descending
std::string buildMasterManifest(std::vector<RenditionSpec> renditions);

} // namespace transcode_service
