#include "application/video_processor.hpp"
#include "application/worker_loop.hpp"
#include "common/config/config.hpp"
#include "common/connection_pool/mysql_connection_pool.hpp"
#include "common/connection_pool/redis_connection_pool.hpp"
#include "common/logging/logging.hpp"
#include "infrastructure/ffmpeg_transcoder.hpp"
#include "infrastructure/local_object_store.hpp"
#include "infrastructure/mysql_video_repository.hpp"
#include "infrastructure/redis_job_queue.hpp"
#include "infrastructure/redis_progress_bus.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <functional>
#include <filesystem>
#include <stop_token>
#include <thread>

int main() {
  try {
    const auto& cfg = config::Config::getInstance();
    common::initLogging(cfg.getLogging());

    const auto& storage_cfg = cfg.getStorage();
    const auto& transcode_cfg = cfg.getTranscode();
    std::filesystem::create_directories(storage_cfg.root_path);
    std::filesystem::create_directories(transcode_cfg.work_dir);

    auto redis_pool = std::make_shared<common::RedisConnectionPool>(cfg.getRedis(), cfg.getRedisCntPool());
    spdlog::info("redis connection established at {}", cfg.getRedisAddress());

    auto mysql_pool = std::make_shared<common::MySQLConnectionPool>(cfg.getDatabase(), cfg.getDBCntPool());
    auto repository = std::make_shared<transcode_service::MysqlVideoRepository>(mysql_pool);
    if (auto migrated = repository->migrate(); !migrated) {
      throw std::runtime_error("schema migration failed: " + migrated.error().describe());
    }

    const auto& queue_cfg = cfg.getQueue();
    auto queue = std::make_shared<transcode_service::RedisJobQueue>(redis_pool, queue_cfg.stream);
    auto progress = std::make_shared<transcode_service::RedisProgressBus>(redis_pool, cfg.getProgress());
    auto store = std::make_shared<transcode_service::LocalObjectStore>(storage_cfg.root_path, storage_cfg.public_base_url);
    auto transcoder = std::make_shared<transcode_service::FfmpegTranscoder>(transcode_cfg);

    auto processor = std::make_shared<transcode_service::VideoProcessor>(
      transcoder, store, repository, progress,
      transcode_service::ProcessorOptions{
        .work_root = transcode_cfg.work_dir,
        .job_timeout = transcode_cfg.job_timeout
      }
    );
    transcode_service::WorkerLoop worker(queue, processor, queue_cfg);

    // 第一次信号: 处理完当前任务后退出; 第二次: 终止正在运行的ffmpeg
    std::stop_source stop;
    std::stop_source abort;
    boost::asio::io_context ioc{1};
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    std::function<void(const boost::system::error_code&, int)> on_signal =
      [&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        if (!stop.stop_requested()) {
          spdlog::info("received signal {}, finishing the current job", signo);
          stop.request_stop();
          signals.async_wait(on_signal);
        } else {
          spdlog::warn("received signal {} again, aborting the current job", signo);
          abort.request_stop();
        }
      };
    signals.async_wait(on_signal);
    std::thread signal_thread([&ioc]() { ioc.run(); });

    spdlog::info("worker {} consuming {} as group {}", queue_cfg.consumer, queue_cfg.stream, queue_cfg.group);
    worker.run(stop.get_token(), abort.get_token());

    auto stats = worker.stats();
    spdlog::info("worker stopped gracefully: processed={} acknowledged={} failed={} poison={} recovered={}",
                 stats.processed, stats.acknowledged, stats.failed, stats.poison, stats.recovered);

    signals.cancel();
    ioc.stop();
    if (signal_thread.joinable()) {
      signal_thread.join();
    }
    common::shutdownLogging();
    return 0;
  } catch (const std::exception& e) {
    spdlog::critical("worker error: {}", e.what());
    return 1;
  }
}
