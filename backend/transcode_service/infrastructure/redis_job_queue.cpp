#include "redis_job_queue.hpp"

#include <spdlog/spdlog.h>

#include <iterator>
#include <optional>

namespace transcode_service {

namespace {

std::string replyString(const redisReply* reply) {
  if (reply && (reply->type == REDIS_REPLY_STRING || reply->type == REDIS_REPLY_STATUS)) {
    return std::string(reply->str, reply->len);
  }
  return {};
}

void setSocketTimeout(redisContext* ctx, std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (redisSetTimeout(ctx, tv) != REDIS_OK) {
    spdlog::warn("redisSetTimeout failed: {}", ctx->errstr);
  }
}

} // namespace

// [id, [field, value, ...]]
std::optional<QueueEntry> parseStreamEntry(const redisReply* reply) {
  if (!reply || reply->type != REDIS_REPLY_ARRAY || reply->elements < 2) {
    return std::nullopt;
  }
  QueueEntry entry{.id = replyString(reply->element[0])};
  const redisReply* fields = reply->element[1];
  if (fields && fields->type == REDIS_REPLY_ARRAY) {
    for (size_t i = 0; i + 1 < fields->elements; i += 2) {
      entry.fields.emplace_back(replyString(fields->element[i]), replyString(fields->element[i + 1]));
    }
  }
  return entry;
}

std::vector<QueueEntry> parseStreamEntries(const redisReply* reply) {
  std::vector<QueueEntry> entries;
  if (!reply || reply->type != REDIS_REPLY_ARRAY) {
    return entries;
  }
  for (size_t i = 0; i < reply->elements; ++i) {
    // XCLAIM返回nil表示条目已被删除
    if (auto entry = parseStreamEntry(reply->element[i])) {
      entries.push_back(std::move(*entry));
    }
  }
  return entries;
}

// [[stream, [entry, ...]], ...] or nil on timeout
std::vector<QueueEntry> parseReadGroupReply(const redisReply* reply) {
  std::vector<QueueEntry> entries;
  if (!reply || reply->type != REDIS_REPLY_ARRAY) {
    return entries;
  }
  for (size_t i = 0; i < reply->elements; ++i) {
    const redisReply* stream = reply->element[i];
    if (!stream || stream->type != REDIS_REPLY_ARRAY || stream->elements < 2) continue;
    auto batch = parseStreamEntries(stream->element[1]);
    std::move(batch.begin(), batch.end(), std::back_inserter(entries));
  }
  return entries;
}

// [[id, consumer, idle_ms, delivery_count], ...]
std::vector<PendingEntry> parsePendingReply(const redisReply* reply) {
  std::vector<PendingEntry> pending;
  if (!reply || reply->type != REDIS_REPLY_ARRAY) {
    return pending;
  }
  for (size_t i = 0; i < reply->elements; ++i) {
    const redisReply* row = reply->element[i];
    if (!row || row->type != REDIS_REPLY_ARRAY || row->elements < 4) continue;
    const redisReply* idle = row->element[2];
    const redisReply* deliveries = row->element[3];
    if (!idle || idle->type != REDIS_REPLY_INTEGER || !deliveries || deliveries->type != REDIS_REPLY_INTEGER) continue;
    pending.push_back(PendingEntry{
      .entry_id = replyString(row->element[0]),
      .consumer_owner = replyString(row->element[1]),
      .idle_time = std::chrono::milliseconds(idle->integer),
      .delivery_count = deliveries->integer
    });
  }
  return pending;
}

bool isNoGroupError(const common::Error& error) {
  return error.message.starts_with("NOGROUP");
}

common::RedisReplyPtr redisCommandArgs(redisContext* ctx, const std::vector<std::string>& args) {
  std::vector<const char*> argv;
  std::vector<size_t> argvlen;
  argv.reserve(args.size());
  argvlen.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.data());
    argvlen.push_back(arg.size());
  }
  return common::RedisReplyPtr{static_cast<redisReply*>(
    redisCommandArgv(ctx, static_cast<int>(argv.size()), argv.data(), argvlen.data()))};
}

RedisJobQueue::RedisJobQueue(std::shared_ptr<common::RedisConnectionPool> pool, std::string stream)
  : pool_(std::move(pool)), stream_(std::move(stream)) {}

common::Result<common::RedisReplyPtr> RedisJobQueue::execute(const std::vector<std::string>& args,
                                                             std::chrono::milliseconds blocking) {
  try {
    common::RedisConnectionGuard guard(*pool_);
    if (!guard.valid()) {
      return common::fail(common::ErrorKind::Transient, "no redis connection available");
    }
    if (blocking.count() > 0) {
      setSocketTimeout(guard.get(), pool_->timeout() + blocking);
    }
    auto reply = redisCommandArgs(guard.get(), args);
    if (blocking.count() > 0 && reply) {
      setSocketTimeout(guard.get(), pool_->timeout());
    }
    if (!reply) {
      std::string reason = guard.get()->errstr;
      guard.discard();
      return common::fail(common::ErrorKind::Transient, args.front() + " failed: " + reason);
    }
    if (reply->type == REDIS_REPLY_ERROR) {
      return common::fail(common::ErrorKind::Transient, std::string(reply->str, reply->len));
    }
    return reply;
  } catch (const std::exception& e) {
    return common::fail(common::ErrorKind::Transient, e.what());
  }
}

common::Result<void> RedisJobQueue::ensureGroup(const std::string& group) {
  auto reply = execute({"XGROUP", "CREATE", stream_, group, "0", "MKSTREAM"});
  if (!reply) {
    if (reply.error().message.starts_with("BUSYGROUP")) {
      return {};
    }
    return std::unexpected(reply.error());
  }
  spdlog::info("created consumer group {} on {}", group, stream_);
  return {};
}

common::Result<std::string> RedisJobQueue::append(const EntryFields& fields) {
  std::vector<std::string> args{"XADD", stream_, "*"};
  for (const auto& [key, value] : fields) {
    args.push_back(key);
    args.push_back(value);
  }
  auto reply = execute(args);
  if (!reply) {
    return std::unexpected(reply.error());
  }
  return replyString(reply->get());
}

common::Result<std::vector<QueueEntry>> RedisJobQueue::readAsGroup(const std::string& group,
                                                                   const std::string& consumer,
                                                                   size_t count,
                                                                   std::chrono::milliseconds max_wait) {
  std::vector<std::string> args{"XREADGROUP", "GROUP", group, consumer, "COUNT", std::to_string(count)};
  // BLOCK 0 would wait forever
  if (max_wait.count() > 0) {
    args.push_back("BLOCK");
    args.push_back(std::to_string(max_wait.count()));
  }
  args.insert(args.end(), {"STREAMS", stream_, ">"});
  auto reply = execute(args, max_wait);
  if (!reply) {
    return std::unexpected(reply.error());
  }
  return parseReadGroupReply(reply->get());
}

common::Result<std::vector<PendingEntry>> RedisJobQueue::listPending(const std::string& group, size_t count) {
  auto reply = execute({"XPENDING", stream_, group, "-", "+", std::to_string(count)});
  if (!reply) {
    return std::unexpected(reply.error());
  }
  return parsePendingReply(reply->get());
}

common::Result<std::vector<QueueEntry>> RedisJobQueue::claim(const std::string& group,
                                                             const std::string& consumer,
                                                             const std::vector<std::string>& entry_ids,
                                                             std::chrono::milliseconds min_idle) {
  if (entry_ids.empty()) {
    return std::vector<QueueEntry>{};
  }
  std::vector<std::string> args{"XCLAIM", stream_, group, consumer, std::to_string(min_idle.count())};
  args.insert(args.end(), entry_ids.begin(), entry_ids.end());

  auto reply = execute(args);
  if (!reply) {
    return std::unexpected(reply.error());
  }
  return parseStreamEntries(reply->get());
}

common::Result<void> RedisJobQueue::ack(const std::string& group, const std::string& entry_id) {
  auto reply = execute({"XACK", stream_, group, entry_id});
  if (!reply) {
    // nothing can be pending in a group that does not exist
    if (isNoGroupError(reply.error())) {
      spdlog::debug("ack of {} on missing group {} ignored", entry_id, group);
      return {};
    }
    return std::unexpected(reply.error());
  }
  return {};
}

} // namespace transcode_service
