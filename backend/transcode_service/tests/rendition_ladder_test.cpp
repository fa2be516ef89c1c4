#include <gtest/gtest.h>

#include "application/rendition_ladder.hpp"

#include <sstream>

namespace transcode_service {
namespace {

std::vector<std::string> variantLines(const std::string& manifest) {
  std::vector<std::string> lines;
  std::istringstream in(manifest);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.front() != '#') lines.push_back(line);
  }
  return lines;
}

TEST(RenditionLadderTest, FullLadderFor2160) {
  EXPECT_EQ(selectLadder(2160), (std::vector<int>{2160, 1440, 1080, 720, 480, 360, 240, 144}));
}

TEST(RenditionLadderTest, SkipsRungsAboveSource) {
  EXPECT_EQ(selectLadder(900), (std::vector<int>{720, 480, 360, 240, 144}));
  EXPECT_EQ(selectLadder(1080), (std::vector<int>{1080, 720, 480, 360, 240, 144}));
}

TEST(RenditionLadderTest, TinySourceGetsSingleCustomRung) {
  EXPECT_EQ(selectLadder(100), (std::vector<int>{100}));
}

TEST(RenditionLadderTest, BandwidthTable) {
  EXPECT_EQ(estimateBandwidth(2160), 8000000);
  EXPECT_EQ(estimateBandwidth(720), 2800000);
  EXPECT_EQ(estimateBandwidth(144), 300000);
  EXPECT_EQ(estimateBandwidth(100), 250000);
}

TEST(RenditionLadderTest, AudioBitrateSteps) {
  EXPECT_EQ(audioBitrateKbps(2160), 192);
  EXPECT_EQ(audioBitrateKbps(1080), 192);
  EXPECT_EQ(audioBitrateKbps(720), 160);
  EXPECT_EQ(audioBitrateKbps(480), 128);
  EXPECT_EQ(audioBitrateKbps(360), 96);
}

TEST(RenditionLadderTest, WidthKeepsAspectAndIsEven) {
  EXPECT_EQ(scaledWidth(1920, 1080, 720), 1280);
  EXPECT_EQ(scaledWidth(1920, 1080, 144), 256);
  EXPECT_EQ(scaledWidth(1080, 1920, 480), 270);  // portrait
  EXPECT_EQ(scaledWidth(0, 0, 360), 640);
  for (int h : kStandardHeights) {
    EXPECT_EQ(scaledWidth(1440, 1080, h) % 2, 0) << h;
  }
}

TEST(RenditionLadderTest, SpecsCarryLabelAndBitrates) {
  auto specs = makeRenditionSpecs(1280, 720);
  ASSERT_EQ(specs.size(), 5u);
  EXPECT_EQ(specs[0].label, "720p");
  EXPECT_EQ(specs[0].width, 1280);
  EXPECT_EQ(specs[0].audio_bitrate_kbps, 160);
  EXPECT_EQ(specs[0].bandwidth, 2800000);
  EXPECT_EQ(specs.back().label, "144p");
}

TEST(MasterManifestTest, OrderedByBandwidthDescending) {
  std::vector<RenditionSpec> specs;
  for (int h : {144, 1080, 480}) {
    specs.push_back(RenditionSpec{
      .height = h,
      .width = scaledWidth(1920, 1080, h),
      .label = renditionLabel(h),
      .audio_bitrate_kbps = audioBitrateKbps(h),
      .bandwidth = estimateBandwidth(h)
    });
  }

  auto manifest = buildMasterManifest(specs);
  EXPECT_EQ(variantLines(manifest),
            (std::vector<std::string>{"1080p/playlist.m3u8", "480p/playlist.m3u8", "144p/playlist.m3u8"}));
  EXPECT_EQ(manifest.rfind("#EXTM3U\n#EXT-X-VERSION:3\n", 0), 0u);
  EXPECT_NE(manifest.find("#EXT-X-STREAM-INF:BANDWIDTH=5000000,RESOLUTION=1920x1080,NAME=\"1080p\""),
            std::string::npos);
}

TEST(MasterManifestTest, EqualBandwidthFallsBackToHeight) {
  std::vector<RenditionSpec> specs{
    {.height = 300, .width = 534, .label = "300p", .bandwidth = 1000},
    {.height = 400, .width = 712, .label = "400p", .bandwidth = 1000},
  };
  EXPECT_EQ(variantLines(buildMasterManifest(specs)),
            (std::vector<std::string>{"400p/playlist.m3u8", "300p/playlist.m3u8"}));
}

} // namespace
} // namespace transcode_service
