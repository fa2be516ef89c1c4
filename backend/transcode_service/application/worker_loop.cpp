#include "worker_loop.hpp"
#include "domain/serialization.hpp"

#include <spdlog/spdlog.h>

#include <condition_variable>

namespace transcode_service {

WorkerLoop::WorkerLoop(std::shared_ptr<JobQueue> queue,
                       std::shared_ptr<VideoProcessor> processor,
                       config::QueueConfig cfg)
  : queue_(std::move(queue)), processor_(std::move(processor)), cfg_(std::move(cfg)) {}

WorkerStats WorkerLoop::stats() const {
  std::lock_guard<std::mutex> lock{stats_mtx_};
  return stats_;
}

void WorkerLoop::setState(WorkerState state) {
  state_.store(state);
  spdlog::info("worker {} -> {}", cfg_.consumer, toString(state));
}

bool WorkerLoop::sleepFor(std::chrono::milliseconds duration, std::stop_token stop) {
  std::mutex mtx;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lock{mtx};
  return cv.wait_for(lock, stop, duration, [] { return false; }) || stop.stop_requested();
}

void WorkerLoop::run(std::stop_token stop, std::stop_token abort) {
  setState(WorkerState::Startup);
  while (!stop.stop_requested()) {
    auto created = queue_->ensureGroup(cfg_.group);
    if (created) break;
    spdlog::error("cannot create consumer group {}: {}", cfg_.group, created.error().describe());
    sleepFor(cfg_.read_error_backoff, stop);
  }

  if (!stop.stop_requested()) {
    setState(WorkerState::Recovering);
    recover(stop, abort);
  }

  if (!stop.stop_requested()) {
    setState(WorkerState::Consuming);
  }
  while (!stop.stop_requested()) {
    auto entries = queue_->readAsGroup(cfg_.group, cfg_.consumer, cfg_.read_count, cfg_.block_timeout);
    if (!entries) {
      spdlog::error("error reading from {}: {}", cfg_.stream, entries.error().describe());
      sleepFor(cfg_.read_error_backoff, stop);
      continue;
    }
    for (const auto& entry : *entries) {
      // entries not started stay pending for recovery
      if (stop.stop_requested()) break;
      handleEntry(entry, abort);
    }
  }

  setState(WorkerState::ShuttingDown);
  setState(WorkerState::Stopped);
}

size_t WorkerLoop::recover(std::stop_token stop, std::stop_token abort) {
  auto pending = queue_->listPending(cfg_.group, cfg_.pending_batch);
  if (!pending) {
    spdlog::warn("skipping recovery, cannot list pending entries: {}", pending.error().describe());
    return 0;
  }
  if (pending->empty()) {
    return 0;
  }
  spdlog::info("found {} pending entries", pending->size());

  std::vector<std::string> ids;
  ids.reserve(pending->size());
  for (const auto& p : *pending) {
    spdlog::debug("pending {} owner={} idle={}ms deliveries={}",
                  p.entry_id, p.consumer_owner, p.idle_time.count(), p.delivery_count);
    ids.push_back(p.entry_id);
  }

  auto claimed = queue_->claim(cfg_.group, cfg_.consumer, ids, cfg_.recovery_min_idle);
  if (!claimed) {
    spdlog::warn("skipping recovery, claim failed: {}", claimed.error().describe());
    return 0;
  }
  {
    std::lock_guard<std::mutex> lock{stats_mtx_};
    stats_.recovered += claimed->size();
  }
  for (size_t i = 0; i < claimed->size(); ++i) {
    if (stop.stop_requested()) {
      spdlog::info("stop requested, {} claimed entries left pending", claimed->size() - i);
      break;
    }
    spdlog::info("recovering entry {}", (*claimed)[i].id);
    handleEntry((*claimed)[i], abort);
  }
  return claimed->size();
}

void WorkerLoop::handleEntry(const QueueEntry& entry, std::stop_token abort) {
  auto job = decodeJobEntry(entry);
  if (!job) {
    // 无法解析的消息直接确认, 避免反复投递
    spdlog::warn("dropping poison entry {}: {}", entry.id, job.error().describe());
    auto acked = queue_->ack(cfg_.group, entry.id);
    if (!acked) {
      spdlog::error("ack of poison entry {} failed: {}", entry.id, acked.error().describe());
    }
    std::lock_guard<std::mutex> lock{stats_mtx_};
    ++stats_.poison;
    if (acked) ++stats_.acknowledged;
    return;
  }

  auto report = processor_->process(*job, abort);
  {
    std::lock_guard<std::mutex> lock{stats_mtx_};
    ++stats_.processed;
    if (!report.succeeded()) ++stats_.failed;
  }

  if (!report.succeeded()) {
    spdlog::error("job {} (entry {}) left pending: {}", job->job_id, entry.id,
                  report.error ? report.error->describe() : std::string("unknown error"));
    return;
  }

  auto acked = queue_->ack(cfg_.group, entry.id);
  if (!acked) {
    spdlog::error("ack of entry {} failed: {}", entry.id, acked.error().describe());
    return;
  }
  std::lock_guard<std::mutex> lock{stats_mtx_};
  ++stats_.acknowledged;
}

} // namespace transcode_service
