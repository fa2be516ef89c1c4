#pragma once

#include "common/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace transcode_service {

// field/value pairs in insertion order, as stored in the stream
using EntryFields = std::vector<std::pair<std::string, std::string>>;

struct QueueEntry {
  std::string id;  // "<millis>-<seq>"
  EntryFields fields;

  const std::string* field(const std::string& name) const {
    for (const auto& [key, value] : fields) {
      if (key == name) return &value;
    }
    return nullptr;
  }
};

struct PendingEntry {
  std::string entry_id;
  std::string consumer_owner;
  std::chrono::milliseconds idle_time{0};
  int64_t delivery_count{0};
};

/*
  Append-only log with consumer-group delivery.
  Per group an entry is unseen, pending under exactly one consumer, or acknowledged.
*/
class JobQueue {
public:
  virtual ~JobQueue() = default;

  // existing group is not an error
  virtual common::Result<void> ensureGroup(const std::string& group) = 0;

  virtual common::Result<std::string> append(const EntryFields& fields) = 0;

  // empty vector on timeout
  virtual common::Result<std::vector<QueueEntry>> readAsGroup(const std::string& group,
                                                              const std::string& consumer,
                                                              size_t count,
                                                              std::chrono::milliseconds max_wait) = 0;

  virtual common::Result<std::vector<PendingEntry>> listPending(const std::string& group, size_t count) = 0;

  // unknown, acknowledged or not-idle-enough ids are skipped
  virtual common::Result<std::vector<QueueEntry>> claim(const std::string& group,
                                                        const std::string& consumer,
                                                        const std::vector<std::string>& entry_ids,
                                                        std::chrono::milliseconds min_idle) = 0;

  // idempotent
  virtual common::Result<void> ack(const std::string& group, const std::string& entry_id) = 0;
};

} // namespace transcode_service
