/// @file log.cpp
/// @brief Library logger setup.

#include "util/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cadence {

namespace {

std::shared_ptr<spdlog::logger> create_logger() {
  if (auto existing = spdlog::get(kLoggerName)) {
    return existing;
  }
  auto created = spdlog::stderr_color_mt(kLoggerName);
  created->set_level(spdlog::level::warn);
  created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  return created;
}

}  // namespace

const std::shared_ptr<spdlog::logger>& logger() {
  static const std::shared_ptr<spdlog::logger> instance = create_logger();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) { logger()->set_level(level); }

}  // namespace cadence
