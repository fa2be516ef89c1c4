#pragma once

#include <cstddef>
#include <string>
#include <chrono>

namespace config {

struct ConnectionPoolConfig{
  size_t min_connections;
  size_t max_connections;
  std::chrono::milliseconds timeout;
};

struct DatabaseConfig {
  std::string host;
  unsigned int port;
  std::string user;
  std::string password;
  std::string db_name;
  std::string charset;
};

struct RedisConfig {
  std::string host;
  unsigned int port;
  std::string password;
  int db{0};
};

// 任务流(redis stream)与消费组
struct QueueConfig {
  std::string stream;
  std::string group;
  std::string consumer;
  std::chrono::milliseconds block_timeout;
  size_t read_count;
  size_t pending_batch;
  std::chrono::milliseconds recovery_min_idle;
  std::chrono::milliseconds read_error_backoff;
};

struct ProgressConfig {
  std::string channel_prefix;    // + job_id
  std::string all_channel;
  std::string snapshot_prefix;   // + job_id
  std::chrono::seconds snapshot_ttl;
};

struct StorageConfig {
  std::string root_path;
  std::string public_base_url;
};

struct TranscodeConfig {
  std::string ffmpeg_bin;
  std::string preset;
  int crf;
  int hls_segment_seconds;
  std::string work_dir;
  std::chrono::seconds job_timeout;
  int av_log_level;
};

struct LoggingConfig {
  std::string level;
  std::string pattern;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Getters
const DatabaseConfig& getDatabase() const { return database_; }
const RedisConfig& getRedis() const { return redis_ ;}
const ConnectionPoolConfig& getDBCntPool() const { return db_cp_; }
const ConnectionPoolConfig& getRedisCntPool() const { return redis_cp_; }
const QueueConfig& getQueue() const { return queue_; }
const ProgressConfig& getProgress() const { return progress_; }
const StorageConfig& getStorage() const { return storage_; }
const TranscodeConfig& getTranscode() const { return transcode_; }
const LoggingConfig& getLogging() const { return logging_; }
std::string getRedisAddress() const { return redis_.host+":"+std::to_string(redis_.port);}

private:
  Config();
  void applyEnvironment();

  RedisConfig redis_;
  DatabaseConfig database_;
  ConnectionPoolConfig db_cp_;
  ConnectionPoolConfig redis_cp_;
  QueueConfig queue_;
  ProgressConfig progress_;
  StorageConfig storage_;
  TranscodeConfig transcode_;
  LoggingConfig logging_;
};

// 读取环境变量, 不存在或为空时返回默认值
std::string getEnv(const char* key, const std::string& default_value);

} // namespace config
