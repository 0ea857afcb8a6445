// =============================================================================
// log.cpp - Engine Logger
// =============================================================================

#include "dsc/log.hpp"
#include "dsc/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace dsc {
namespace log {

namespace {
constexpr const char* LOGGER_NAME = "dsc";
}

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get(LOGGER_NAME);
        if (existing) return existing;

        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

void set_level(std::string_view name) {
    std::string level_name(name);
    auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && level_name != "off") {
        throw ConfigError("unknown log level '" + level_name + "'");
    }
    set_level(level);
}

} // namespace log
} // namespace dsc
