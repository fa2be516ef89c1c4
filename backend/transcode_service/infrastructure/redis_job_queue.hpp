#pragma once

#include "common/connection_pool/redis_connection_pool.hpp"
#include "domain/job_queue.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace transcode_service {

// Redis Streams: XADD / XGROUP / XREADGROUP / XPENDING / XCLAIM / XACK on one stream key
class RedisJobQueue : public JobQueue {
public:
  RedisJobQueue(std::shared_ptr<common::RedisConnectionPool> pool, std::string stream);

  common::Result<void> ensureGroup(const std::string& group) override;
  common::Result<std::string> append(const EntryFields& fields) override;
  common::Result<std::vector<QueueEntry>> readAsGroup(const std::string& group,
                                                      const std::string& consumer,
                                                      size_t count,
                                                      std::chrono::milliseconds max_wait) override;
  common::Result<std::vector<PendingEntry>> listPending(const std::string& group, size_t count) override;
  common::Result<std::vector<QueueEntry>> claim(const std::string& group,
                                                const std::string& consumer,
                                                const std::vector<std::string>& entry_ids,
                                                std::chrono::milliseconds min_idle) override;
  common::Result<void> ack(const std::string& group, const std::string& entry_id) override;

private:
  // error replies come back as Transient errors carrying the server message.
  // blocking extends the socket timeout for commands the server holds (XREADGROUP BLOCK).
  common::Result<common::RedisReplyPtr> execute(const std::vector<std::string>& args,
                                                std::chrono::milliseconds blocking = std::chrono::milliseconds(0));

  std::shared_ptr<common::RedisConnectionPool> pool_;
  std::string stream_;
};

// shared with the pub/sub adapter
common::RedisReplyPtr redisCommandArgs(redisContext* ctx, const std::vector<std::string>& args);

// reply decoding; malformed parts are skipped
std::optional<QueueEntry> parseStreamEntry(const redisReply* reply);
std::vector<QueueEntry> parseStreamEntries(const redisReply* reply);   // XCLAIM, nil items skipped
std::vector<QueueEntry> parseReadGroupReply(const redisReply* reply);  // XREADGROUP, nil -> empty
std::vector<PendingEntry> parsePendingReply(const redisReply* reply);  // XPENDING - + count

// "NOGROUP ..." server error
bool isNoGroupError(const common::Error& error);

} // namespace transcode_service
