#include <hybridstore/config/config_helpers.h>
#include <hybridstore/config/logging.h>

namespace hybridstore::config {

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    std::string v = to_lower(name);
    trim(v);
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical")
        return spdlog::level::critical;
    if (v == "off" || v == "none")
        return spdlog::level::off;
    return std::nullopt;
}

Result<void> configureLogging(const std::string& levelName) {
    auto level = parseLogLevel(levelName);
    if (!level) {
        return Error{ErrorCode::ValidationError, "Unknown log level '" + levelName + "'"};
    }
    spdlog::set_level(*level);
    spdlog::debug("Log level set to {}", spdlog::level::to_string_view(*level));
    return Result<void>();
}

} // namespace hybridstore::config
