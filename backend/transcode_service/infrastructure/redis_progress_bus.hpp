#pragma once

#include "common/config/config.hpp"
#include "common/connection_pool/redis_connection_pool.hpp"
#include "domain/progress_bus.hpp"

#include <memory>
#include <string>

namespace transcode_service {

// true when some job id would publish on the all channel
bool channelsCollide(const config::ProgressConfig& cfg);

/*
  PUBLISH to "<channel_prefix><job_id>" and the all channel, then SET "<snapshot_prefix><job_id>" EX ttl.
  Each subscription owns a dedicated connection and reader thread; it never borrows from the pool.
*/
class RedisProgressBus : public ProgressBus {
public:
  // throws std::invalid_argument when channelsCollide(cfg)
  RedisProgressBus(std::shared_ptr<common::RedisConnectionPool> pool, config::ProgressConfig cfg);

  common::Result<void> publish(const ProgressEvent& event) override;
  common::Result<std::optional<ProgressEvent>> getSnapshot(const std::string& job_id) override;
  common::Result<std::unique_ptr<ProgressSubscription>> subscribe(const std::string& job_id) override;
  common::Result<std::unique_ptr<ProgressSubscription>> subscribeAll() override;

private:
  common::Result<std::unique_ptr<ProgressSubscription>> open(const std::string& channel, bool close_on_terminal);

  std::shared_ptr<common::RedisConnectionPool> pool_;
  config::ProgressConfig cfg_;
};

} // namespace transcode_service
