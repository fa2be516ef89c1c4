#include "redis_progress_bus.hpp"
#include "domain/serialization.hpp"
#include "redis_job_queue.hpp"

#include <spdlog/spdlog.h>

#include <poll.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string_view>
#include <thread>

namespace transcode_service {

namespace {

constexpr int kPollIntervalMs = 200;

struct SubscriptionReader {
  common::RedisContextPtr ctx;
  std::jthread thread;
};

// 返回false表示连接已断开或订阅已关闭
bool dispatch(redisReply* reply, common::Channel<ProgressEvent>& sink) {
  if (reply->type != REDIS_REPLY_ARRAY || reply->elements < 3) {
    return true;
  }
  std::string kind(reply->element[0]->str, reply->element[0]->len);
  if (kind != "message") {
    return true;
  }
  const redisReply* payload = reply->element[2];
  auto event = decodeProgress(std::string(payload->str, payload->len));
  if (!event) {
    spdlog::warn("skipping undecodable progress message: {}", event.error().describe());
    return true;
  }
  return sink.push(std::move(*event));
}

void readLoop(std::stop_token stop, redisContext* ctx, std::shared_ptr<common::Channel<ProgressEvent>> sink) {
  while (!stop.stop_requested()) {
    // hiredis可能已缓冲了多条消息, 先取完再poll
    void* raw = nullptr;
    if (redisGetReplyFromReader(ctx, &raw) != REDIS_OK) {
      spdlog::warn("progress subscription protocol error: {}", ctx->errstr);
      break;
    }
    if (raw != nullptr) {
      common::RedisReplyPtr reply{static_cast<redisReply*>(raw)};
      if (!dispatch(reply.get(), *sink)) break;
      continue;
    }

    pollfd pfd{.fd = ctx->fd, .events = POLLIN, .revents = 0};
    int ready = ::poll(&pfd, 1, kPollIntervalMs);
    if (ready < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("progress subscription poll failed: {}", std::strerror(errno));
      break;
    }
    if (ready == 0) continue;
    if (redisBufferRead(ctx) != REDIS_OK) {
      spdlog::warn("progress subscription connection lost: {}", ctx->errstr);
      break;
    }
  }
  sink->close();
}

} // namespace

bool channelsCollide(const config::ProgressConfig& cfg) {
  if (!cfg.all_channel.starts_with(cfg.channel_prefix)) return false;
  return isValidJobId(std::string_view(cfg.all_channel).substr(cfg.channel_prefix.size()));
}

RedisProgressBus::RedisProgressBus(std::shared_ptr<common::RedisConnectionPool> pool, config::ProgressConfig cfg)
  : pool_(std::move(pool)), cfg_(std::move(cfg)) {
  if (channelsCollide(cfg_)) {
    throw std::invalid_argument("progress all channel " + cfg_.all_channel +
                                " is also the channel of a job under prefix " + cfg_.channel_prefix);
  }
}

common::Result<void> RedisProgressBus::publish(const ProgressEvent& event) {
  const auto payload = encodeProgress(event);
  try {
    common::RedisConnectionGuard guard(*pool_);
    if (!guard.valid()) {
      return common::fail(common::ErrorKind::Transient, "no redis connection available");
    }

    const std::vector<std::vector<std::string>> commands{
      {"PUBLISH", cfg_.channel_prefix + event.job_id, payload},
      {"PUBLISH", cfg_.all_channel, payload},
      {"SET", cfg_.snapshot_prefix + event.job_id, payload, "EX", std::to_string(cfg_.snapshot_ttl.count())}
    };
    for (const auto& args : commands) {
      auto reply = redisCommandArgs(guard.get(), args);
      if (!reply) {
        std::string reason = guard.get()->errstr;
        guard.discard();
        return common::fail(common::ErrorKind::Transient, args.front() + " failed: " + reason);
      }
      if (reply->type == REDIS_REPLY_ERROR) {
        return common::fail(common::ErrorKind::Transient, std::string(reply->str, reply->len));
      }
    }
    return {};
  } catch (const std::exception& e) {
    return common::fail(common::ErrorKind::Transient, e.what());
  }
}

common::Result<std::optional<ProgressEvent>> RedisProgressBus::getSnapshot(const std::string& job_id) {
  std::string payload;
  try {
    common::RedisConnectionGuard guard(*pool_);
    if (!guard.valid()) {
      return common::fail(common::ErrorKind::Transient, "no redis connection available");
    }
    auto reply = redisCommandArgs(guard.get(), {"GET", cfg_.snapshot_prefix + job_id});
    if (!reply) {
      std::string reason = guard.get()->errstr;
      guard.discard();
      return common::fail(common::ErrorKind::Transient, "GET failed: " + reason);
    }
    if (reply->type == REDIS_REPLY_NIL) {
      return std::optional<ProgressEvent>{};
    }
    if (reply->type != REDIS_REPLY_STRING) {
      return common::fail(common::ErrorKind::Transient, "unexpected reply to GET");
    }
    payload.assign(reply->str, reply->len);
  } catch (const std::exception& e) {
    return common::fail(common::ErrorKind::Transient, e.what());
  }

  auto event = decodeProgress(payload);
  if (!event) {
    return std::unexpected(event.error());
  }
  return std::optional<ProgressEvent>{std::move(*event)};
}

common::Result<std::unique_ptr<ProgressSubscription>> RedisProgressBus::open(const std::string& channel,
                                                                              bool close_on_terminal) {
  auto ctx = common::connectRedis(pool_->redisConfig(), std::chrono::milliseconds(5000));
  if (!ctx) {
    return common::fail(common::ErrorKind::Transient, "cannot open subscriber connection");
  }

  auto confirm = redisCommandArgs(ctx.get(), {"SUBSCRIBE", channel});
  if (!confirm || confirm->type == REDIS_REPLY_ERROR) {
    return common::fail(common::ErrorKind::Transient, "SUBSCRIBE " + channel + " failed");
  }

  auto sink = std::make_shared<common::Channel<ProgressEvent>>();
  auto reader = std::make_shared<SubscriptionReader>();
  reader->ctx = std::move(ctx);
  reader->thread = std::jthread(readLoop, reader->ctx.get(), sink);
  spdlog::debug("subscribed to {}", channel);

  return std::make_unique<ProgressSubscription>(sink, close_on_terminal, [reader]() {
    reader->thread.request_stop();
    if (reader->thread.joinable()) {
      reader->thread.join();
    }
  });
}

common::Result<std::unique_ptr<ProgressSubscription>> RedisProgressBus::subscribe(const std::string& job_id) {
  return open(cfg_.channel_prefix + job_id, true);
}

common::Result<std::unique_ptr<ProgressSubscription>> RedisProgressBus::subscribeAll() {
  return open(cfg_.all_channel, false);
}

} // namespace transcode_service
