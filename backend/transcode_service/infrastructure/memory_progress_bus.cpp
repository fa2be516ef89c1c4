#include "memory_progress_bus.hpp"

namespace transcode_service {

MemoryProgressBus::MemoryProgressBus(std::chrono::milliseconds snapshot_ttl)
  : snapshot_ttl_(snapshot_ttl), registry_(std::make_shared<Registry>()) {}

common::Result<void> MemoryProgressBus::publish(const ProgressEvent& event) {
  {
    std::lock_guard<std::mutex> lock{registry_->mtx};
    if (auto it = registry_->topics.find(event.job_id); it != registry_->topics.end()) {
      for (auto& [id, sink] : it->second) {
        sink->push(event);
      }
    }
    for (auto& [id, sink] : registry_->all) {
      sink->push(event);
    }
  }

  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock{snapshot_mtx_};
  pruneExpired(now);
  snapshots_[event.job_id] = Snapshot{event, now + snapshot_ttl_};
  return {};
}

void MemoryProgressBus::pruneExpired(std::chrono::steady_clock::time_point now) {
  std::erase_if(snapshots_, [now](const auto& item) { return now >= item.second.expires_at; });
}

common::Result<std::optional<ProgressEvent>> MemoryProgressBus::getSnapshot(const std::string& job_id) {
  std::lock_guard<std::mutex> lock{snapshot_mtx_};
  auto it = snapshots_.find(job_id);
  if (it == snapshots_.end()) {
    return std::optional<ProgressEvent>{};
  }
  if (std::chrono::steady_clock::now() >= it->second.expires_at) {
    snapshots_.erase(it);
    return std::optional<ProgressEvent>{};
  }
  return std::optional<ProgressEvent>{it->second.event};
}

size_t MemoryProgressBus::snapshotCount() const {
  std::lock_guard<std::mutex> lock{snapshot_mtx_};
  return snapshots_.size();
}

std::unique_ptr<ProgressSubscription> MemoryProgressBus::attach(std::optional<std::string> job_id, bool close_on_terminal) {
  auto sink = std::make_shared<common::Channel<ProgressEvent>>();
  uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock{registry_->mtx};
    id = registry_->next_id++;
    if (job_id) {
      registry_->topics[*job_id].emplace(id, sink);
    } else {
      registry_->all.emplace(id, sink);
    }
  }

  std::weak_ptr<Registry> weak = registry_;
  return std::make_unique<ProgressSubscription>(sink, close_on_terminal, [weak, job_id, id]() {
    auto registry = weak.lock();
    if (!registry) return;
    std::lock_guard<std::mutex> lock{registry->mtx};
    if (!job_id) {
      registry->all.erase(id);
      return;
    }
    auto it = registry->topics.find(*job_id);
    if (it == registry->topics.end()) return;
    it->second.erase(id);
    if (it->second.empty()) {
      registry->topics.erase(it);
    }
  });
}

common::Result<std::unique_ptr<ProgressSubscription>> MemoryProgressBus::subscribe(const std::string& job_id) {
  return attach(job_id, true);
}

common::Result<std::unique_ptr<ProgressSubscription>> MemoryProgressBus::subscribeAll() {
  return attach(std::nullopt, false);
}

size_t MemoryProgressBus::subscriberCount() const {
  std::lock_guard<std::mutex> lock{registry_->mtx};
  size_t count = registry_->all.size();
  for (const auto& [topic, sinks] : registry_->topics) {
    count += sinks.size();
  }
  return count;
}

} // namespace transcode_service
