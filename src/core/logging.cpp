/// @file src/core/logging.cpp
/// @brief Shared spdlog logger.

#include "rmce/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace rmce::log {

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get("rmce")) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt("rmce");
        created->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

bool set_level(std::string_view level) {
    const std::string name(level);
    const auto parsed = spdlog::level::from_str(name);

    // from_str maps unknown names to `off`; only accept `off` when asked for.
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace rmce::log
