#include "redis_connection_pool.hpp"
#include "common/config/config.hpp"
#include "common/connection_pool/connection_pool.hpp"
#include <cstring>
#include <stdexcept>
#include <hiredis/hiredis.h>

namespace common {

RedisContextPtr connectRedis(const config::RedisConfig& cfg, std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

  RedisContextPtr ctx{redisConnectWithTimeout(cfg.host.c_str(), static_cast<int>(cfg.port), tv)};
  if (!ctx || ctx->err) {
    return nullptr;
  }

  if (!cfg.password.empty()) {
    RedisReplyPtr reply{static_cast<redisReply*>(redisCommand(ctx.get(), "AUTH %s", cfg.password.c_str()))};
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
      return nullptr;
    }
  }
  if (cfg.db != 0) {
    RedisReplyPtr reply{static_cast<redisReply*>(redisCommand(ctx.get(), "SELECT %d", cfg.db))};
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
      return nullptr;
    }
  }
  return ctx;
}

RedisConnection& RedisConnection::operator=(RedisConnection&& other) noexcept {
  if (this != &other) {
    if (conn_) {
      redisFree(conn_);
    }
    conn_ = other.conn_;
    other.conn_ = nullptr;
  }
  return *this;
}

bool RedisConnection::isValid() const {
  if (!conn_ || conn_->err) return false;
  RedisReplyPtr reply{static_cast<redisReply*>(redisCommand(conn_, "PING"))};
  if (!reply || reply->type != REDIS_REPLY_STATUS) {
    return false;
  }
  return !std::strcmp(reply->str, "PONG");
}

RedisConnectionPool::RedisConnectionPool(const config::RedisConfig& redis_config,
                                         const config::ConnectionPoolConfig& pool_config)
  : ConnectionPool(pool_config), redis_config_(redis_config) {
  prefill();
  if (cp_config_.min_connections > 0 && pool_.empty()) {
    throw std::runtime_error("Failed to connect to Redis at " + redis_config_.host + ":" + std::to_string(redis_config_.port));
  }
}

std::unique_ptr<Connection> RedisConnectionPool::createConnection() {
  auto ctx = connectRedis(redis_config_, cp_config_.timeout);
  if (!ctx) {
    return nullptr;
  }
  return std::make_unique<RedisConnection>(ctx.release());
}

} // namespace common
