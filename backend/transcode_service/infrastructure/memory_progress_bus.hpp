#pragma once

#include "domain/progress_bus.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace transcode_service {

class MemoryProgressBus : public ProgressBus {
public:
  explicit MemoryProgressBus(std::chrono::milliseconds snapshot_ttl = std::chrono::hours(24));

  common::Result<void> publish(const ProgressEvent& event) override;
  common::Result<std::optional<ProgressEvent>> getSnapshot(const std::string& job_id) override;
  common::Result<std::unique_ptr<ProgressSubscription>> subscribe(const std::string& job_id) override;
  common::Result<std::unique_ptr<ProgressSubscription>> subscribeAll() override;

  size_t subscriberCount() const;
  // includes expired snapshots not yet pruned
  size_t snapshotCount() const;

private:
  using Sink = std::shared_ptr<common::Channel<ProgressEvent>>;

  // 订阅表单独持有, 订阅对象可以比总线活得更久
  struct Registry {
    std::mutex mtx;
    uint64_t next_id{1};
    std::unordered_map<std::string, std::map<uint64_t, Sink>> topics;
    std::map<uint64_t, Sink> all;  // subscribeAll, never keyed by a job id
  };

  struct Snapshot {
    ProgressEvent event;
    std::chrono::steady_clock::time_point expires_at;
  };

  // nullopt attaches to every job
  std::unique_ptr<ProgressSubscription> attach(std::optional<std::string> job_id, bool close_on_terminal);
  void pruneExpired(std::chrono::steady_clock::time_point now);

  std::chrono::milliseconds snapshot_ttl_;
  std::shared_ptr<Registry> registry_;
  mutable std::mutex snapshot_mtx_;
  std::unordered_map<std::string, Snapshot> snapshots_;
};

} // namespace transcode_service
