#include "memory_job_queue.hpp"

namespace transcode_service {

namespace {

common::Error noGroup(const std::string& group) {
  return common::Error{common::ErrorKind::Transient, "NOGROUP no such consumer group '" + group + "'"};
}

} // namespace

std::string MemoryJobQueue::nextId() {
  auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  if (now_ms > last_ms_) {
    last_ms_ = now_ms;
    last_seq_ = 0;
  } else {
    ++last_seq_;
  }
  return std::to_string(last_ms_) + "-" + std::to_string(last_seq_);
}

common::Result<void> MemoryJobQueue::ensureGroup(const std::string& group) {
  std::lock_guard<std::mutex> lock{mtx_};
  groups_.try_emplace(group);
  return {};
}

common::Result<std::string> MemoryJobQueue::append(const EntryFields& fields) {
  std::string id;
  {
    std::lock_guard<std::mutex> lock{mtx_};
    id = nextId();
    index_of_.emplace(id, entries_.size());
    entries_.push_back(QueueEntry{.id = id, .fields = fields});
  }
  appended_.notify_all();
  return id;
}

common::Result<std::vector<QueueEntry>> MemoryJobQueue::readAsGroup(const std::string& group,
                                                                    const std::string& consumer,
                                                                    size_t count,
                                                                    std::chrono::milliseconds max_wait) {
  std::unique_lock<std::mutex> lock{mtx_};
  if (!groups_.contains(group)) {
    return std::unexpected(noGroup(group));
  }
  appended_.wait_for(lock, max_wait, [this, &group]() {
    return groups_[group].next_index < entries_.size();
  });

  auto& state = groups_[group];
  std::vector<QueueEntry> delivered;
  const auto now = std::chrono::steady_clock::now();
  while (state.next_index < entries_.size() && delivered.size() < count) {
    state.pending[state.next_index] = Delivery{consumer, now, 1};
    delivered.push_back(entries_[state.next_index]);
    ++state.next_index;
  }
  return delivered;
}

common::Result<std::vector<PendingEntry>> MemoryJobQueue::listPending(const std::string& group, size_t count) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = groups_.find(group);
  if (it == groups_.end()) {
    return std::unexpected(noGroup(group));
  }

  const auto now = std::chrono::steady_clock::now();
  std::vector<PendingEntry> result;
  for (const auto& [index, delivery] : it->second.pending) {
    if (result.size() >= count) break;
    result.push_back(PendingEntry{
      .entry_id = entries_[index].id,
      .consumer_owner = delivery.consumer,
      .idle_time = std::chrono::duration_cast<std::chrono::milliseconds>(now - delivery.delivered_at),
      .delivery_count = delivery.delivery_count
    });
  }
  return result;
}

common::Result<std::vector<QueueEntry>> MemoryJobQueue::claim(const std::string& group,
                                                              const std::string& consumer,
                                                              const std::vector<std::string>& entry_ids,
                                                              std::chrono::milliseconds min_idle) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = groups_.find(group);
  if (it == groups_.end()) {
    return std::unexpected(noGroup(group));
  }

  const auto now = std::chrono::steady_clock::now();
  std::vector<QueueEntry> claimed;
  for (const auto& id : entry_ids) {
    auto index = index_of_.find(id);
    if (index == index_of_.end()) continue;
    auto pending = it->second.pending.find(index->second);
    if (pending == it->second.pending.end()) continue;

    auto& delivery = pending->second;
    if (now - delivery.delivered_at < min_idle) continue;
    delivery.consumer = consumer;
    delivery.delivered_at = now;
    ++delivery.delivery_count;
    claimed.push_back(entries_[index->second]);
  }
  return claimed;
}

common::Result<void> MemoryJobQueue::ack(const std::string& group, const std::string& entry_id) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = groups_.find(group);
  if (it == groups_.end()) {
    return {};
  }
  auto index = index_of_.find(entry_id);
  if (index != index_of_.end()) {
    it->second.pending.erase(index->second);
  }
  return {};
}

size_t MemoryJobQueue::size() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return entries_.size();
}

} // namespace transcode_service
