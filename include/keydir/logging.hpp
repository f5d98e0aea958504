#pragma once

/**
 * @file logging.hpp
 * @brief Process-wide spdlog logger for the storage engine
 */

#include "keydir/common.hpp"

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace keydir::logging {

/// Name of the engine's logger in the spdlog registry
inline constexpr std::string_view kLoggerName = "keydir";

/**
 * @brief Return the engine logger, creating a stderr logger on first use
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the engine log level from its textual name
 * @return Error if @p level is not a spdlog level name
 */
[[nodiscard]] keydir::VoidResult set_level(std::string_view level);

}  // namespace keydir::logging
