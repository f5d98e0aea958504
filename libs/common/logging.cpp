/**
 * @file logging.cpp
 * @brief spdlog logger setup
 */

#include "keydir/logging.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace keydir::logging {

std::shared_ptr<spdlog::logger> logger()
{
    static std::once_flag once;
    std::call_once(once, [] {
        if (!spdlog::get(std::string(kLoggerName))) {
            auto created = spdlog::stderr_color_mt(std::string(kLoggerName));
            created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            created->set_level(spdlog::level::info);
        }
    });
    return spdlog::get(std::string(kLoggerName));
}

keydir::VoidResult set_level(std::string_view level)
{
    const std::string name(level);
    auto parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && name != "off") {
        return std::unexpected(
            make_error(errc::kConfigError, "Unknown log level: " + name));
    }
    logger()->set_level(parsed);
    return {};
}

}  // namespace keydir::logging
