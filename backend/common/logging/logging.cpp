#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace common {

void initLogging(const config::LoggingConfig& cfg) {
  auto logger = spdlog::stdout_color_mt("vodpipe");
  logger->set_pattern(cfg.pattern);
  logger->set_level(spdlog::level::from_str(cfg.level));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void shutdownLogging() {
  spdlog::shutdown();
}

} // namespace common
