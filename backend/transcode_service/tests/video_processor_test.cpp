#include <gtest/gtest.h>

#include "application/progress_tracker.hpp"
#include "application/video_processor.hpp"
#include "infrastructure/local_object_store.hpp"
#include "infrastructure/memory_progress_bus.hpp"
#include "test_doubles.hpp"

#include <fstream>
#include <sstream>

namespace transcode_service {
namespace {

using namespace std::chrono_literals;
using fakes::FakeTranscoder;
using fakes::FlakyVideoRepository;
using fakes::TempDir;

std::vector<ProgressEvent> drain(ProgressSubscription& subscription) {
  std::vector<ProgressEvent> events;
  while (auto event = subscription.next(0ms)) {
    events.push_back(*event);
  }
  return events;
}

std::string readFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

class VideoProcessorTest : public ::testing::Test {
protected:
  VideoProcessorTest()
    : objects_("vodpipe_objects"),
      work_("vodpipe_work"),
      transcoder_(std::make_shared<FakeTranscoder>()),
      store_(std::make_shared<LocalObjectStore>(objects_.path(), "http://cdn.test/")),
      repository_(std::make_shared<FlakyVideoRepository>()),
      bus_(std::make_shared<MemoryProgressBus>()) {}

  void SetUp() override {
    auto all = bus_->subscribeAll();
    ASSERT_TRUE(all.has_value());
    events_ = std::move(*all);
  }

  VideoProcessor makeProcessor(std::chrono::seconds timeout = 60s) {
    return VideoProcessor(transcoder_, store_, repository_, bus_,
                          ProcessorOptions{.work_root = work_.path(), .job_timeout = timeout});
  }

  VideoJob submit(const std::string& id) {
    auto now = Clock::now();
    EXPECT_TRUE(repository_->createAsset(VideoAsset{
      .id = id, .original_name = id + ".mp4", .source_location = "/uploads/" + id + ".mp4",
      .created_at = now, .updated_at = now}).has_value());
    return VideoJob{.job_id = id, .source_location = "/uploads/" + id + ".mp4", .original_name = id + ".mp4"};
  }

  TempDir objects_;
  TempDir work_;
  std::shared_ptr<FakeTranscoder> transcoder_;
  std::shared_ptr<LocalObjectStore> store_;
  std::shared_ptr<FlakyVideoRepository> repository_;
  std::shared_ptr<MemoryProgressBus> bus_;
  std::unique_ptr<ProgressSubscription> events_;
};

TEST_F(VideoProcessorTest, EndToEnd1080Source) {
  auto processor = makeProcessor();
  auto report = processor.process(submit("v1"));

  ASSERT_TRUE(report.succeeded()) << (report.error ? report.error->describe() : "");
  EXPECT_TRUE(report.best_effort_failures.empty());
  EXPECT_EQ(transcoder_->calls(), (std::vector<int>{1080, 720, 480, 360, 240, 144}));

  EXPECT_EQ(repository_->statusHistory("v1"),
            (std::vector<VideoStatus>{VideoStatus::Waiting, VideoStatus::Processing, VideoStatus::Completed}));

  auto asset = repository_->findById("v1");
  ASSERT_TRUE(asset.has_value() && asset->has_value());
  EXPECT_EQ((*asset)->status, VideoStatus::Completed);
  EXPECT_TRUE((*asset)->completed_at.has_value());
  EXPECT_FALSE((*asset)->error_message.has_value());
  EXPECT_EQ((*asset)->source_height, 1080);
  EXPECT_EQ((*asset)->master_manifest_location, "v1/processed/master.m3u8");
  EXPECT_EQ((*asset)->master_manifest_url, "http://cdn.test/v1/processed/master.m3u8");

  auto renditions = repository_->listRenditions("v1");
  ASSERT_TRUE(renditions.has_value());
  ASSERT_EQ(renditions->size(), 6u);
  EXPECT_EQ(renditions->front().label, "1080p");
  EXPECT_EQ(renditions->front().artifact_location, "v1/processed/1080p/playlist.m3u8");
  EXPECT_EQ(renditions->front().segment_count, 2);
  EXPECT_GT(renditions->front().size_bytes, 0);

  EXPECT_TRUE(std::filesystem::exists(objects_.path() / "v1/processed/720p/segment_000.ts"));
  EXPECT_TRUE(std::filesystem::exists(objects_.path() / "v1/processed/144p/playlist.m3u8"));

  auto manifest = readFile(objects_.path() / "v1/processed/master.m3u8");
  auto p1080 = manifest.find("1080p/playlist.m3u8");
  auto p720 = manifest.find("720p/playlist.m3u8");
  auto p144 = manifest.find("144p/playlist.m3u8");
  ASSERT_NE(p1080, std::string::npos);
  EXPECT_LT(p1080, p720);
  EXPECT_LT(p720, p144);
  EXPECT_EQ(manifest.find("2160p"), std::string::npos);
  EXPECT_EQ(manifest.find("1440p"), std::string::npos);

  // work directories are removed
  EXPECT_TRUE(std::filesystem::is_empty(work_.path()));
}

TEST_F(VideoProcessorTest, ProgressIsMonotonicUntilTerminal) {
  auto processor = makeProcessor();
  ASSERT_TRUE(processor.process(submit("v1")).succeeded());

  auto events = drain(*events_);
  ASSERT_GE(events.size(), 3u);
  EXPECT_EQ(events.front().percent, 0);
  EXPECT_EQ(events.front().message, "Starting video processing...");
  EXPECT_EQ(events.back().status, VideoStatus::Completed);
  EXPECT_EQ(events.back().percent, 100);
  EXPECT_EQ(events.back().message, "Processing completed successfully!");

  int last = 0;
  for (const auto& event : events) {
    EXPECT_EQ(event.job_id, "v1");
    EXPECT_GE(event.percent, last) << event.message.value_or("");
    last = event.percent;
  }

  // first event of each stage: 5 + i*90/6
  std::vector<int> stage_percents;
  for (const auto& event : events) {
    if (event.current_stage_index &&
        static_cast<size_t>(*event.current_stage_index) == stage_percents.size() + 1) {
      stage_percents.push_back(event.percent);
    }
  }
  EXPECT_EQ(stage_percents, (std::vector<int>{5, 20, 35, 50, 65, 80}));

  auto snapshot = bus_->getSnapshot("v1");
  ASSERT_TRUE(snapshot.has_value() && snapshot->has_value());
  EXPECT_EQ((*snapshot)->status, VideoStatus::Completed);
}

TEST_F(VideoProcessorTest, StageEventNamesRendition) {
  auto processor = makeProcessor();
  ASSERT_TRUE(processor.process(submit("v1")).succeeded());

  bool found = false;
  for (const auto& event : drain(*events_)) {
    if (event.message == "Processing 720p (2/6)...") {
      found = true;
      EXPECT_EQ(event.current_rendition, 720);
      EXPECT_EQ(event.current_stage_index, 2);
      EXPECT_EQ(event.total_stages, 6);
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(VideoProcessorTest, ProbeFailureFailsJob) {
  transcoder_->fail_probe = true;
  auto processor = makeProcessor();
  auto report = processor.process(submit("v1"));

  EXPECT_FALSE(report.succeeded());
  EXPECT_EQ(report.status, VideoStatus::Failed);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->kind, common::ErrorKind::Probe);
  EXPECT_TRUE(transcoder_->calls().empty());

  auto asset = repository_->findById("v1");
  ASSERT_TRUE(asset.has_value() && asset->has_value());
  EXPECT_EQ((*asset)->status, VideoStatus::Failed);
  ASSERT_TRUE((*asset)->error_message.has_value());
  EXPECT_EQ((*asset)->error_message->rfind("failed to read video metadata: ", 0), 0u);

  auto events = drain(*events_);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().status, VideoStatus::Failed);
  EXPECT_EQ(events.back().percent, 0);
}

TEST_F(VideoProcessorTest, RenditionFailureStopsLadder) {
  transcoder_->fail_heights = {480};
  auto processor = makeProcessor();
  auto report = processor.process(submit("v1"));

  ASSERT_FALSE(report.succeeded());
  EXPECT_EQ(report.error->kind, common::ErrorKind::Transcode);
  EXPECT_EQ(report.error->message.rfind("failed to transcode 480p: ", 0), 0u);
  EXPECT_EQ(transcoder_->calls(), (std::vector<int>{1080, 720, 480}));
  EXPECT_EQ(report.renditions.size(), 2u);
  EXPECT_FALSE(report.master_manifest_location.has_value());

  auto asset = repository_->findById("v1");
  ASSERT_TRUE(asset.has_value() && asset->has_value());
  EXPECT_EQ((*asset)->status, VideoStatus::Failed);
  EXPECT_FALSE((*asset)->completed_at.has_value());
  EXPECT_FALSE(std::filesystem::exists(objects_.path() / "v1/processed/master.m3u8"));

  auto events = drain(*events_);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().status, VideoStatus::Failed);
  EXPECT_GE(events.back().percent, 35);
}

TEST_F(VideoProcessorTest, PersistenceFailuresAreBestEffort) {
  repository_->fail_renditions = true;
  auto processor = makeProcessor();
  auto report = processor.process(submit("v1"));

  EXPECT_TRUE(report.succeeded());
  ASSERT_EQ(report.best_effort_failures.size(), 6u);
  for (const auto& failure : report.best_effort_failures) {
    EXPECT_EQ(failure.operation, "upsert rendition");
    EXPECT_EQ(failure.error.kind, common::ErrorKind::Persistence);
  }
  auto renditions = repository_->listRenditions("v1");
  ASSERT_TRUE(renditions.has_value());
  EXPECT_TRUE(renditions->empty());
}

TEST_F(VideoProcessorTest, MissingAssetRowDoesNotFailJob) {
  auto processor = makeProcessor();
  auto report = processor.process(VideoJob{.job_id = "ghost", .source_location = "/uploads/ghost.mp4"});

  EXPECT_TRUE(report.succeeded());
  EXPECT_FALSE(report.best_effort_failures.empty());
}

TEST_F(VideoProcessorTest, ReprocessingOverwritesRenditions) {
  auto processor = makeProcessor();
  auto job = submit("v1");
  ASSERT_TRUE(processor.process(job).succeeded());
  auto first = repository_->listRenditions("v1");
  ASSERT_TRUE(first.has_value());

  ASSERT_TRUE(processor.process(job).succeeded());
  auto second = repository_->listRenditions("v1");
  ASSERT_TRUE(second.has_value());
  ASSERT_EQ(second->size(), 6u);
  for (size_t i = 0; i < second->size(); ++i) {
    EXPECT_EQ((*second)[i].id, (*first)[i].id);
  }
}

TEST_F(VideoProcessorTest, AbortCancelsJob) {
  std::stop_source abort;
  abort.request_stop();
  auto processor = makeProcessor();
  auto report = processor.process(submit("v1"), abort.get_token());

  ASSERT_FALSE(report.succeeded());
  EXPECT_EQ(report.error->kind, common::ErrorKind::Cancelled);
}

TEST_F(VideoProcessorTest, DeadlineFailsAsTimeout) {
  transcoder_->delay = 1100ms;
  auto processor = makeProcessor(1s);
  auto report = processor.process(submit("v1"));

  ASSERT_FALSE(report.succeeded());
  EXPECT_EQ(report.error->kind, common::ErrorKind::Timeout);
  EXPECT_EQ(transcoder_->calls().size(), 1u);
}

TEST_F(VideoProcessorTest, SmallSourceSingleCustomRendition) {
  transcoder_ = std::make_shared<FakeTranscoder>(ProbeResult{.width = 160, .height = 100, .duration_seconds = 4.0});
  auto processor = makeProcessor();
  auto report = processor.process(submit("tiny"));

  ASSERT_TRUE(report.succeeded());
  ASSERT_EQ(report.renditions.size(), 1u);
  EXPECT_EQ(report.renditions.front().label, "100p");
  EXPECT_EQ(report.renditions.front().bandwidth_estimate, 250000);
}

TEST(ProgressTrackerTest, ClampsRegressionsButNotTerminal) {
  MemoryProgressBus bus;
  auto all = bus.subscribeAll();
  ASSERT_TRUE(all.has_value());

  ProgressTracker tracker(bus, "v1");
  ASSERT_TRUE(tracker.publish({.status = VideoStatus::Processing, .percent = 40}).has_value());
  ASSERT_TRUE(tracker.publish({.status = VideoStatus::Processing, .percent = 20}).has_value());
  EXPECT_EQ(tracker.lastPercent(), 40);
  ASSERT_TRUE(tracker.publish({.status = VideoStatus::Failed, .percent = 10}).has_value());

  auto a = (*all)->next(0ms);
  auto b = (*all)->next(0ms);
  auto c = (*all)->next(0ms);
  ASSERT_TRUE(a && b && c);
  EXPECT_EQ(a->percent, 40);
  EXPECT_EQ(b->percent, 40);
  EXPECT_EQ(c->percent, 10);
  EXPECT_EQ(c->job_id, "v1");
  EXPECT_NE(c->timestamp, TimePoint{});
}

} // namespace
} // namespace transcode_service
