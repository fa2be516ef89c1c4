#pragma once

#include "common/config/config.hpp"

namespace common {

// 初始化全局默认logger, main中调用一次
void initLogging(const config::LoggingConfig& cfg);
void shutdownLogging();

} // namespace common
