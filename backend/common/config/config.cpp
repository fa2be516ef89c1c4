#include "config.hpp"
#include <chrono>
#include <cstdlib>
#include <stdexcept>

extern "C" {
  #include <libavutil/log.h>
}

namespace config {

std::string getEnv(const char* key, const std::string& default_value) {
  const char* value = std::getenv(key);
  if (value == nullptr || *value == '\0') {
    return default_value;
  }
  return value;
}

namespace {

unsigned int parsePort(const std::string& text, const char* what) {
  try {
    auto port = std::stoul(text);
    if (port == 0 || port > 65535) {
      throw std::out_of_range(what);
    }
    return static_cast<unsigned int>(port);
  } catch (const std::exception&) {
    throw std::runtime_error(std::string("Invalid port for ") + what + ": " + text);
  }
}

long parsePositive(const std::string& text, const char* what) {
  try {
    auto value = std::stol(text);
    if (value <= 0) {
      throw std::out_of_range(what);
    }
    return value;
  } catch (const std::exception&) {
    throw std::runtime_error(std::string("Invalid value for ") + what + ": " + text);
  }
}

} // namespace

Config::Config() {
  db_cp_ = {
    .min_connections = 2,
    .max_connections = 8,
    .timeout = std::chrono::milliseconds(5000)
  };

  redis_cp_ = {
    .min_connections = 2,
    .max_connections = 8,
    .timeout = std::chrono::milliseconds(5000)
  };

  redis_ = {
    .host = "127.0.0.1",
    .port = 6379,
    .password = "",
    .db = 0
  };

  database_ = {
    .host = "localhost",
    .port = 3306,
    .user = "root",
    .password = "",
    .db_name = "video_processing",
    .charset = "utf8mb4",
  };

  queue_ = {
    .stream = "video:jobs",
    .group = "video-workers",
    .consumer = "worker-1",
    .block_timeout = std::chrono::milliseconds(5000),
    .read_count = 1,
    .pending_batch = 100,
    .recovery_min_idle = std::chrono::milliseconds(0),
    .read_error_backoff = std::chrono::milliseconds(2000)
  };

  progress_ = {
    .channel_prefix = "video:progress:",
    .all_channel = "video:progress-all",  // not reachable as channel_prefix + job id
    .snapshot_prefix = "progress:",
    .snapshot_ttl = std::chrono::hours(24)
  };

  storage_ = {
    .root_path = "/var/lib/vodpipe/objects",
    .public_base_url = "http://127.0.0.1:8080"
  };

  transcode_ = {
    .ffmpeg_bin = "ffmpeg",
    .preset = "ultrafast",
    .crf = 23,
    .hls_segment_seconds = 10,
    .work_dir = "/tmp",
    .job_timeout = std::chrono::hours(2),
    .av_log_level = AV_LOG_ERROR
  };

  logging_ = {
    .level = "info",
    .pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"
  };

  applyEnvironment();
}

void Config::applyEnvironment() {
  // REDIS_ADDR=host:port
  auto redis_addr = getEnv("REDIS_ADDR", "");
  if (!redis_addr.empty()) {
    auto colon = redis_addr.rfind(':');
    if (colon == std::string::npos) {
      redis_.host = redis_addr;
    } else {
      redis_.host = redis_addr.substr(0, colon);
      redis_.port = parsePort(redis_addr.substr(colon + 1), "REDIS_ADDR");
    }
  }
  redis_.password = getEnv("REDIS_PASSWORD", redis_.password);

  database_.host = getEnv("DB_HOST", database_.host);
  database_.port = parsePort(getEnv("DB_PORT", std::to_string(database_.port)), "DB_PORT");
  database_.user = getEnv("DB_USER", database_.user);
  database_.password = getEnv("DB_PASSWORD", database_.password);
  database_.db_name = getEnv("DB_NAME", database_.db_name);

  queue_.consumer = getEnv("HOSTNAME", queue_.consumer);

  storage_.root_path = getEnv("STORAGE_ROOT", storage_.root_path);
  storage_.public_base_url = getEnv("STORAGE_PUBLIC_URL", storage_.public_base_url);

  transcode_.ffmpeg_bin = getEnv("FFMPEG_BIN", transcode_.ffmpeg_bin);
  transcode_.work_dir = getEnv("WORK_DIR", transcode_.work_dir);
  auto timeout = getEnv("JOB_TIMEOUT_SECONDS", "");
  if (!timeout.empty()) {
    transcode_.job_timeout = std::chrono::seconds(parsePositive(timeout, "JOB_TIMEOUT_SECONDS"));
  }

  logging_.level = getEnv("VODPIPE_LOG_LEVEL", logging_.level);
  logging_.pattern = getEnv("VODPIPE_LOG_PATTERN", logging_.pattern);
}

} // namespace config
