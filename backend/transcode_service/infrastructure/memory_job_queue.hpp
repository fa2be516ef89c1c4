#pragma once

#include "domain/job_queue.hpp"

#include <condition_variable>
#include <map>
#include <mutex>
#include <unordered_map>

namespace transcode_service {

// In-process queue with the same group semantics as the stream adapter.
// Groups start from the beginning of the log.
class MemoryJobQueue : public JobQueue {
public:
  MemoryJobQueue() = default;

  common::Result<void> ensureGroup(const std::string& group) override;
  common::Result<std::string> append(const EntryFields& fields) override;
  common::Result<std::vector<QueueEntry>> readAsGroup(const std::string& group,
                                                      const std::string& consumer,
                                                      size_t count,
                                                      std::chrono::milliseconds max_wait) override;
  common::Result<std::vector<PendingEntry>> listPending(const std::string& group, size_t count) override;
  common::Result<std::vector<QueueEntry>> claim(const std::string& group,
                                                const std::string& consumer,
                                                const std::vector<std::string>& entry_ids,
                                                std::chrono::milliseconds min_idle) override;
  common::Result<void> ack(const std::string& group, const std::string& entry_id) override;

  size_t size() const;

private:
  struct Delivery {
    std::string consumer;
    std::chrono::steady_clock::time_point delivered_at;
    int64_t delivery_count{0};
  };

  struct GroupState {
    size_t next_index{0};               // first entry not yet delivered to the group
    std::map<size_t, Delivery> pending; // by log position
  };

  std::string nextId();

  mutable std::mutex mtx_;
  std::condition_variable appended_;
  std::vector<QueueEntry> entries_;
  std::unordered_map<std::string, size_t> index_of_;
  std::unordered_map<std::string, GroupState> groups_;
  int64_t last_ms_{0};
  int64_t last_seq_{0};
};

} // namespace transcode_service
