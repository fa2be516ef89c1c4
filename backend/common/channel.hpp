#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace common {

// 多生产者多消费者的无界通道, close()之后push失败, pop取完剩余元素后返回nullopt
template <typename T>
class Channel {
public:
  Channel() = default;
  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  bool push(T value) {
    {
      std::lock_guard<std::mutex> lock{mtx_};
      if (closed_) return false;
      items_.push(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  // Blocks until an item arrives, the channel is closed and drained, or timeout.
  std::optional<T> pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock{mtx_};
    cv_.wait_for(lock, timeout, [this]() { return closed_ || !items_.empty(); });
    if (items_.empty()) return std::nullopt;
    T value = std::move(items_.front());
    items_.pop();
    return value;
  }

  std::optional<T> tryPop() {
    std::lock_guard<std::mutex> lock{mtx_};
    if (items_.empty()) return std::nullopt;
    T value = std::move(items_.front());
    items_.pop();
    return value;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock{mtx_};
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock{mtx_};
    return closed_;
  }

  // closed and nothing left to read
  bool drained() const {
    std::lock_guard<std::mutex> lock{mtx_};
    return closed_ && items_.empty();
  }

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::queue<T> items_;
  bool closed_{false};
};

} // namespace common
