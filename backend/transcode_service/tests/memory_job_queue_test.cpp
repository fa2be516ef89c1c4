#include <gtest/gtest.h>

#include "domain/serialization.hpp"
#include "infrastructure/memory_job_queue.hpp"

#include <mutex>
#include <set>
#include <thread>

namespace transcode_service {
namespace {

using namespace std::chrono_literals;

constexpr const char* kGroup = "video-workers";

EntryFields jobFields(const std::string& id) {
  return encodeJobEntry(VideoJob{.job_id = id, .source_location = "/src/" + id + ".mp4", .original_name = id}, Clock::now());
}

class MemoryJobQueueTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(queue_.ensureGroup(kGroup).has_value());
  }

  MemoryJobQueue queue_;
};

TEST_F(MemoryJobQueueTest, EnsureGroupTwiceIsNotAnError) {
  EXPECT_TRUE(queue_.ensureGroup(kGroup).has_value());
}

TEST_F(MemoryJobQueueTest, ReadWithoutGroupFails) {
  auto read = queue_.readAsGroup("missing", "c1", 1, 0ms);
  ASSERT_FALSE(read.has_value());
  EXPECT_EQ(read.error().kind, common::ErrorKind::Transient);
}

TEST_F(MemoryJobQueueTest, EntryIdsAreOrderedMillisSeq) {
  auto a = queue_.append(jobFields("a"));
  auto b = queue_.append(jobFields("b"));
  ASSERT_TRUE(a && b);
  EXPECT_NE(a->find('-'), std::string::npos);
  EXPECT_NE(*a, *b);
}

TEST_F(MemoryJobQueueTest, EmptyReadTimesOut) {
  auto start = std::chrono::steady_clock::now();
  auto read = queue_.readAsGroup(kGroup, "c1", 1, 50ms);
  ASSERT_TRUE(read.has_value());
  EXPECT_TRUE(read->empty());
  EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST_F(MemoryJobQueueTest, BlockedReadWakesOnAppend) {
  std::thread producer([this]() {
    std::this_thread::sleep_for(30ms);
    ASSERT_TRUE(queue_.append(jobFields("late")).has_value());
  });
  auto read = queue_.readAsGroup(kGroup, "c1", 1, 2000ms);
  producer.join();
  ASSERT_TRUE(read.has_value());
  ASSERT_EQ(read->size(), 1u);
  EXPECT_EQ(*read->front().field("job_id"), "late");
}

TEST_F(MemoryJobQueueTest, DeliveredEntryBecomesPendingForConsumer) {
  auto id = queue_.append(jobFields("v1"));
  ASSERT_TRUE(id.has_value());

  auto read = queue_.readAsGroup(kGroup, "c1", 10, 0ms);
  ASSERT_TRUE(read.has_value());
  ASSERT_EQ(read->size(), 1u);
  EXPECT_EQ(read->front().id, *id);

  auto pending = queue_.listPending(kGroup, 100);
  ASSERT_TRUE(pending.has_value());
  ASSERT_EQ(pending->size(), 1u);
  EXPECT_EQ(pending->front().entry_id, *id);
  EXPECT_EQ(pending->front().consumer_owner, "c1");
  EXPECT_EQ(pending->front().delivery_count, 1);

  // never delivered twice to the group
  auto again = queue_.readAsGroup(kGroup, "c2", 10, 0ms);
  ASSERT_TRUE(again.has_value());
  EXPECT_TRUE(again->empty());
}

TEST_F(MemoryJobQueueTest, GroupsAreIndependent) {
  ASSERT_TRUE(queue_.append(jobFields("v1")).has_value());
  ASSERT_TRUE(queue_.ensureGroup("auditors").has_value());

  auto workers = queue_.readAsGroup(kGroup, "c1", 10, 0ms);
  auto auditors = queue_.readAsGroup("auditors", "a1", 10, 0ms);
  ASSERT_TRUE(workers && auditors);
  EXPECT_EQ(workers->size(), 1u);
  EXPECT_EQ(auditors->size(), 1u);
}

TEST_F(MemoryJobQueueTest, AckIsIdempotent) {
  auto id = queue_.append(jobFields("v1"));
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(queue_.readAsGroup(kGroup, "c1", 1, 0ms).has_value());

  EXPECT_TRUE(queue_.ack(kGroup, *id).has_value());
  EXPECT_TRUE(queue_.ack(kGroup, *id).has_value());
  EXPECT_TRUE(queue_.ack(kGroup, "0-0").has_value());
  EXPECT_TRUE(queue_.ack("unknown-group", *id).has_value());

  auto pending = queue_.listPending(kGroup, 100);
  ASSERT_TRUE(pending.has_value());
  EXPECT_TRUE(pending->empty());

  // an acked entry can neither be claimed nor read again
  auto claimed = queue_.claim(kGroup, "c2", {*id}, 0ms);
  ASSERT_TRUE(claimed.has_value());
  EXPECT_TRUE(claimed->empty());
  auto read = queue_.readAsGroup(kGroup, "c2", 10, 0ms);
  ASSERT_TRUE(read.has_value());
  EXPECT_TRUE(read->empty());
}

TEST_F(MemoryJobQueueTest, ClaimTransfersOwnership) {
  auto id = queue_.append(jobFields("v1"));
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(queue_.readAsGroup(kGroup, "crashed", 1, 0ms).has_value());

  auto claimed = queue_.claim(kGroup, "rescuer", {*id, "999-0"}, 0ms);
  ASSERT_TRUE(claimed.has_value());
  ASSERT_EQ(claimed->size(), 1u);
  EXPECT_EQ(*claimed->front().field("job_id"), "v1");

  auto pending = queue_.listPending(kGroup, 100);
  ASSERT_TRUE(pending.has_value());
  ASSERT_EQ(pending->size(), 1u);
  EXPECT_EQ(pending->front().consumer_owner, "rescuer");
  EXPECT_EQ(pending->front().delivery_count, 2);
}

TEST_F(MemoryJobQueueTest, ClaimRespectsMinIdle) {
  auto id = queue_.append(jobFields("v1"));
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(queue_.readAsGroup(kGroup, "busy", 1, 0ms).has_value());

  auto early = queue_.claim(kGroup, "rescuer", {*id}, 10s);
  ASSERT_TRUE(early.has_value());
  EXPECT_TRUE(early->empty());

  std::this_thread::sleep_for(20ms);
  auto late = queue_.claim(kGroup, "rescuer", {*id}, 10ms);
  ASSERT_TRUE(late.has_value());
  EXPECT_EQ(late->size(), 1u);
}

TEST_F(MemoryJobQueueTest, ListPendingHonoursCountAndOrder) {
  std::vector<std::string> ids;
  for (int i = 0; i < 5; ++i) {
    auto id = queue_.append(jobFields("v" + std::to_string(i)));
    ASSERT_TRUE(id.has_value());
    ids.push_back(*id);
  }
  ASSERT_TRUE(queue_.readAsGroup(kGroup, "c1", 5, 0ms).has_value());

  auto pending = queue_.listPending(kGroup, 3);
  ASSERT_TRUE(pending.has_value());
  ASSERT_EQ(pending->size(), 3u);
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_EQ((*pending)[i].entry_id, ids[i]);
  }
}

TEST_F(MemoryJobQueueTest, ConcurrentConsumersNeverShareAnEntry) {
  constexpr int kJobs = 200;
  for (int i = 0; i < kJobs; ++i) {
    ASSERT_TRUE(queue_.append(jobFields("v" + std::to_string(i))).has_value());
  }

  std::mutex mtx;
  std::multiset<std::string> seen;
  auto consume = [&](const std::string& consumer) {
    while (true) {
      auto read = queue_.readAsGroup(kGroup, consumer, 3, 20ms);
      ASSERT_TRUE(read.has_value());
      if (read->empty()) return;
      std::lock_guard<std::mutex> lock{mtx};
      for (const auto& entry : *read) seen.insert(entry.id);
    }
  };
  std::thread a(consume, "a");
  std::thread b(consume, "b");
  std::thread c(consume, "c");
  a.join();
  b.join();
  c.join();

  EXPECT_EQ(seen.size(), static_cast<size_t>(kJobs));
  for (const auto& id : seen) {
    EXPECT_EQ(seen.count(id), 1u) << id;
  }
}

} // namespace
} // namespace transcode_service
