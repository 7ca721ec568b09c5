#pragma once

#include <spdlog/spdlog.h>
#include <optional>
#include <string>
#include <hybridstore/core/types.h>

namespace hybridstore::config {

/**
 * @brief Map a level name (trace, debug, info, warn, error, critical, off) to spdlog
 *
 * Case-insensitive; "warning", "err" and "none" are accepted as aliases.
 */
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

/**
 * @brief Set the default logger's level from @p levelName
 * @return ValidationError for an unknown level name
 */
Result<void> configureLogging(const std::string& levelName);

} // namespace hybridstore::config
