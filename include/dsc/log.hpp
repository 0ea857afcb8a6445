#ifndef DSC_LOG_HPP
#define DSC_LOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace dsc {
namespace log {

// Shared "dsc" logger (stderr, colored); created on first use
std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "critical" or "off";
// throws ConfigError on anything else
void set_level(std::string_view name);

} // namespace log
} // namespace dsc

#endif // DSC_LOG_HPP
