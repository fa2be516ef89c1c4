#include <gtest/gtest.h>

#include "domain/serialization.hpp"

#include <nlohmann/json.hpp>

namespace transcode_service {
namespace {

TEST(JobEntryTest, EncodesWireFields) {
  VideoJob job{.job_id = "v1", .source_location = "/uploads/v1.mp4", .original_name = "holiday.mp4"};
  auto fields = encodeJobEntry(job, fromUnixMillis(1700000000123));

  QueueEntry entry{.id = "1-0", .fields = fields};
  ASSERT_NE(entry.field("job_id"), nullptr);
  EXPECT_EQ(*entry.field("job_id"), "v1");
  EXPECT_EQ(*entry.field("source_location"), "/uploads/v1.mp4");
  EXPECT_EQ(*entry.field("original_name"), "holiday.mp4");
  EXPECT_EQ(*entry.field("enqueued_at"), "1700000000");

  auto payload = nlohmann::json::parse(*entry.field("payload"));
  EXPECT_EQ(payload["job_id"], "v1");

  auto decoded = decodeJobEntry(entry);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->original_name, "holiday.mp4");
}

TEST(JobEntryTest, MissingPayloadIsMalformed) {
  QueueEntry entry{.id = "1-0", .fields = {{"job_id", "v1"}}};
  auto decoded = decodeJobEntry(entry);
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error().kind, common::ErrorKind::Malformed);
}

TEST(JobEntryTest, GarbagePayloadIsMalformed) {
  for (const char* payload : {"not json", "[1,2]", R"({"job_id":"v1"})", R"({"job_id":7,"source_location":"x"})"}) {
    QueueEntry entry{.id = "1-0", .fields = {{"payload", payload}}};
    auto decoded = decodeJobEntry(entry);
    ASSERT_FALSE(decoded.has_value()) << payload;
    EXPECT_EQ(decoded.error().kind, common::ErrorKind::Malformed) << payload;
  }
}

TEST(JobEntryTest, UnsafeJobIdIsMalformed) {
  for (const char* payload : {R"({"job_id":"*","source_location":"/a.mp4"})",
                              R"({"job_id":"../v1","source_location":"/a.mp4"})",
                              R"({"job_id":"v 1","source_location":"/a.mp4"})"}) {
    QueueEntry entry{.id = "1-0", .fields = {{"payload", payload}}};
    auto decoded = decodeJobEntry(entry);
    ASSERT_FALSE(decoded.has_value()) << payload;
    EXPECT_EQ(decoded.error().kind, common::ErrorKind::Malformed) << payload;
  }
}

TEST(JobIdTest, OnlyKeyAndTopicSafeCharacters) {
  EXPECT_TRUE(isValidJobId("v1"));
  EXPECT_TRUE(isValidJobId("all"));
  EXPECT_TRUE(isValidJobId("3f2c9a4e-8b1d-4c6e-9f0a-1b2c3d4e5f60"));
  EXPECT_TRUE(isValidJobId("job_42"));
  EXPECT_TRUE(isValidJobId(std::string(kMaxJobIdLength, 'a')));

  EXPECT_FALSE(isValidJobId(""));
  EXPECT_FALSE(isValidJobId("*"));
  EXPECT_FALSE(isValidJobId("a:b"));
  EXPECT_FALSE(isValidJobId("a/b"));
  EXPECT_FALSE(isValidJobId(".."));
  EXPECT_FALSE(isValidJobId("v 1"));
  EXPECT_FALSE(isValidJobId(std::string(kMaxJobIdLength + 1, 'a')));
}

TEST(ProgressCodecTest, OptionalFieldsAreOmitted) {
  ProgressEvent event{.job_id = "v1", .status = VideoStatus::Processing, .percent = 5,
                      .total_stages = 6, .message = "Processing 6 renditions...",
                      .timestamp = fromUnixMillis(1700000000123)};
  auto doc = nlohmann::json::parse(encodeProgress(event));
  EXPECT_EQ(doc["status"], "processing");
  EXPECT_EQ(doc["timestamp"], 1700000000123);
  EXPECT_EQ(doc["total_stages"], 6);
  EXPECT_FALSE(doc.contains("current_stage_index"));
  EXPECT_FALSE(doc.contains("current_rendition"));

  auto decoded = decodeProgress(doc.dump());
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->total_stages, 6);
  EXPECT_FALSE(decoded->current_rendition.has_value());
  EXPECT_EQ(toUnixMillis(decoded->timestamp), 1700000000123);
}

TEST(ProgressCodecTest, RejectsUnknownStatus) {
  auto decoded = decodeProgress(R"({"job_id":"v1","status":"exploded","percent":1,"timestamp":0})");
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error().kind, common::ErrorKind::Malformed);
  EXPECT_FALSE(decodeProgress("{").has_value());
}

TEST(VideoStatusTest, LegacyPendingMeansWaiting) {
  EXPECT_EQ(parseVideoStatus("pending"), VideoStatus::Waiting);
  EXPECT_FALSE(parseVideoStatus("bogus").has_value());
  EXPECT_TRUE(isTerminal(VideoStatus::Failed));
  EXPECT_FALSE(isTerminal(VideoStatus::Processing));
}

TEST(VideoStatusTest, AllowedTransitions) {
  EXPECT_TRUE(canTransition(VideoStatus::Waiting, VideoStatus::Processing));
  EXPECT_TRUE(canTransition(VideoStatus::Failed, VideoStatus::Processing));
  EXPECT_TRUE(canTransition(VideoStatus::Completed, VideoStatus::Processing));
  EXPECT_TRUE(canTransition(VideoStatus::Processing, VideoStatus::Completed));
  EXPECT_FALSE(canTransition(VideoStatus::Waiting, VideoStatus::Completed));
  EXPECT_FALSE(canTransition(VideoStatus::Processing, VideoStatus::Waiting));
}

} // namespace
} // namespace transcode_service
