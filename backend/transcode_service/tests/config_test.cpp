#include <gtest/gtest.h>

#include "common/config/config.hpp"
#include "infrastructure/redis_progress_bus.hpp"

namespace transcode_service {
namespace {

TEST(ConfigTest, PoolSectionsAreUsable) {
  const auto& cfg = config::Config::getInstance();
  for (const auto& pool : {cfg.getDBCntPool(), cfg.getRedisCntPool()}) {
    EXPECT_GT(pool.max_connections, 0u);
    EXPECT_LE(pool.min_connections, pool.max_connections);
    EXPECT_GT(pool.timeout.count(), 0);
  }
}

TEST(ConfigTest, DefaultProgressChannelsAreDistinct) {
  const auto& progress = config::Config::getInstance().getProgress();
  EXPECT_FALSE(channelsCollide(progress));
  EXPECT_NE(progress.channel_prefix + "all", progress.all_channel);
}

} // namespace
} // namespace transcode_service
