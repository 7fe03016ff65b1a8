#pragma once

/// @file log.h
/// @brief Library logger (spdlog).

#include <memory>

#include <spdlog/spdlog.h>

namespace cadence {

/// @brief Name under which the library logger is registered with spdlog.
constexpr const char* kLoggerName = "cadence";

/// @brief Returns the library logger.
/// @details Created on first use with a stderr colour sink at level warn.
///          If the host registered a logger named "cadence" beforehand, that one is used.
const std::shared_ptr<spdlog::logger>& logger();

/// @brief Sets the library log level.
/// @param level spdlog level (trace .. off)
void set_log_level(spdlog::level::level_enum level);

}  // namespace cadence
