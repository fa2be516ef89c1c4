#pragma once

#include "common/channel.hpp"
#include "common/error.hpp"
#include "progress_event.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace transcode_service {

// 可取消的事件流. 单任务订阅收到终态事件后自动关闭
class ProgressSubscription {
public:
  using CloseHook = std::function<void()>;

  ProgressSubscription(std::shared_ptr<common::Channel<ProgressEvent>> channel,
                       bool close_on_terminal,
                       CloseHook on_close)
    : channel_(std::move(channel)), close_on_terminal_(close_on_terminal), on_close_(std::move(on_close)) {}

  ~ProgressSubscription() { close(); }

  ProgressSubscription(const ProgressSubscription&) = delete;
  ProgressSubscription& operator=(const ProgressSubscription&) = delete;

  // nullopt on timeout or once the stream has ended
  std::optional<ProgressEvent> next(std::chrono::milliseconds timeout) {
    auto event = channel_->pop(timeout);
    if (event && close_on_terminal_ && isTerminal(event->status)) {
      close();
    }
    return event;
  }

  void close() {
    channel_->close();
    if (on_close_) {
      auto hook = std::move(on_close_);
      on_close_ = nullptr;
      hook();
    }
  }

  bool finished() const { return channel_->drained(); }

private:
  std::shared_ptr<common::Channel<ProgressEvent>> channel_;
  bool close_on_terminal_;
  CloseHook on_close_;
};

class ProgressBus {
public:
  virtual ~ProgressBus() = default;

  // job topic + global topic + snapshot with renewed ttl; never waits for subscribers
  virtual common::Result<void> publish(const ProgressEvent& event) = 0;

  virtual common::Result<std::optional<ProgressEvent>> getSnapshot(const std::string& job_id) = 0;

  virtual common::Result<std::unique_ptr<ProgressSubscription>> subscribe(const std::string& job_id) = 0;
  virtual common::Result<std::unique_ptr<ProgressSubscription>> subscribeAll() = 0;
};

} // namespace transcode_service
