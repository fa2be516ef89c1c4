#pragma once

#include "common/config/config.hpp"
#include "common/connection_pool/connection_pool.hpp"
#include <hiredis/hiredis.h>
#include <chrono>
#include <memory>

namespace common {

struct RedisReplyDeleter {
  void operator()(redisReply* reply) const { if (reply) freeReplyObject(reply); }
};
using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

struct RedisContextDeleter {
  void operator()(redisContext* ctx) const { if (ctx) redisFree(ctx); }
};
using RedisContextPtr = std::unique_ptr<redisContext, RedisContextDeleter>;

// 建立一条独立连接(AUTH/SELECT已完成), 失败返回nullptr; 订阅等长连接场景使用, 不进入连接池
RedisContextPtr connectRedis(const config::RedisConfig& cfg, std::chrono::milliseconds timeout);

class RedisConnection : public Connection {
public:
  explicit RedisConnection(redisContext* conn): conn_(conn) {}
  ~RedisConnection() override { if (conn_) redisFree(conn_); }

  redisContext* get() const { return conn_; }
  bool isValid() const override;

  RedisConnection(RedisConnection&& other) noexcept : conn_(other.conn_) {other.conn_ = nullptr; }
  RedisConnection& operator=(RedisConnection&& other) noexcept;

private:
  redisContext* conn_ = nullptr;
};


class RedisConnectionPool final : public ConnectionPool{
public:
  RedisConnectionPool(const config::RedisConfig& redis_config, const config::ConnectionPoolConfig& pool_config);
  ~RedisConnectionPool() override { shutdown(); }

  const config::RedisConfig& redisConfig() const { return redis_config_; }

protected:
  std::unique_ptr<Connection> createConnection() override;

private:
  config::RedisConfig redis_config_;
};

class RedisConnectionGuard final : public ConnectionGuard{
  using ConnectionGuard::ConnectionGuard;
public:
  redisContext* get() const {
    return static_cast<RedisConnection*>(conn_.get())->get();
  }

};
} // namespace common
