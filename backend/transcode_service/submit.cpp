#include "application/job_producer.hpp"
#include "common/config/config.hpp"
#include "common/connection_pool/mysql_connection_pool.hpp"
#include "common/connection_pool/redis_connection_pool.hpp"
#include "common/logging/logging.hpp"
#include "infrastructure/mysql_video_repository.hpp"
#include "infrastructure/redis_job_queue.hpp"
#include "infrastructure/redis_progress_bus.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace transcode_service;

namespace {

void usage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " [--follow] [--id <job_id>] [--name <original_name>] <source_location>\n"
            << "       " << argv0 << " --watch <job_id>\n";
}

void printEvent(const ProgressEvent& event) {
  std::cout << "[" << toString(event.status) << "] " << event.percent << "%";
  if (event.current_stage_index && event.total_stages) {
    std::cout << " (" << *event.current_stage_index << "/" << *event.total_stages << ")";
  }
  if (event.message) {
    std::cout << " " << *event.message;
  }
  std::cout << std::endl;
}

// 先订阅再读快照, 避免两者之间的事件丢失
int follow(ProgressBus& bus, const std::string& job_id) {
  auto subscription = bus.subscribe(job_id);
  if (!subscription) {
    std::cerr << "subscribe failed: " << subscription.error().describe() << std::endl;
    return 1;
  }

  std::optional<VideoStatus> last;
  if (auto snapshot = bus.getSnapshot(job_id); snapshot && *snapshot) {
    printEvent(**snapshot);
    last = (*snapshot)->status;
  } else if (!snapshot) {
    std::cerr << "snapshot unavailable: " << snapshot.error().describe() << std::endl;
  }

  while (!last || !isTerminal(*last)) {
    auto event = (*subscription)->next(std::chrono::seconds(1));
    if (event) {
      printEvent(*event);
      last = event->status;
    } else if ((*subscription)->finished()) {
      std::cerr << "progress stream closed" << std::endl;
      return 1;
    }
  }
  return *last == VideoStatus::Completed ? 0 : 2;
}

} // namespace

int main(int argc, char** argv) {
  bool follow_progress = false;
  std::optional<std::string> job_id;
  std::optional<std::string> watch_id;
  std::string original_name;
  std::string source;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--follow") {
      follow_progress = true;
    } else if (arg == "--id" && i + 1 < argc) {
      job_id = argv[++i];
    } else if (arg == "--name" && i + 1 < argc) {
      original_name = argv[++i];
    } else if (arg == "--watch" && i + 1 < argc) {
      watch_id = argv[++i];
    } else if (!arg.starts_with("--") && source.empty()) {
      source = arg;
    } else {
      usage(argv[0]);
      return 1;
    }
  }
  if (source.empty() && !watch_id) {
    usage(argv[0]);
    return 1;
  }
  if (watch_id && !isValidJobId(*watch_id)) {
    std::cerr << "invalid job id: " << *watch_id << std::endl;
    return 1;
  }

  try {
    const auto& cfg = config::Config::getInstance();
    common::initLogging(cfg.getLogging());

    auto redis_pool = std::make_shared<common::RedisConnectionPool>(cfg.getRedis(), cfg.getRedisCntPool());
    auto progress = std::make_shared<RedisProgressBus>(redis_pool, cfg.getProgress());

    if (watch_id) {
      return follow(*progress, *watch_id);
    }

    auto mysql_pool = std::make_shared<common::MySQLConnectionPool>(cfg.getDatabase(), cfg.getDBCntPool());
    auto repository = std::make_shared<MysqlVideoRepository>(mysql_pool);
    if (auto migrated = repository->migrate(); !migrated) {
      std::cerr << "schema migration failed: " << migrated.error().describe() << std::endl;
      return 1;
    }
    auto queue = std::make_shared<RedisJobQueue>(redis_pool, cfg.getQueue().stream);

    if (original_name.empty()) {
      original_name = std::filesystem::path(source).filename().string();
    }
    JobProducer producer(queue, repository);
    auto job = producer.submit(source, original_name, job_id);
    if (!job) {
      std::cerr << "submit failed: " << job.error().describe() << std::endl;
      return 1;
    }
    std::cout << job->job_id << std::endl;

    return follow_progress ? follow(*progress, job->job_id) : 0;
  } catch (const std::exception& e) {
    spdlog::critical("submit error: {}", e.what());
    return 1;
  }
}
