#include "evidenceforge/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ef {

void init_logging(spdlog::level::level_enum level)
{
    auto logger = spdlog::get("evidenceforge");
    if (!logger) logger = spdlog::stderr_color_mt("evidenceforge");
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

bool parse_log_level(const std::string& s, spdlog::level::level_enum& out)
{
    const spdlog::level::level_enum lvl = spdlog::level::from_str(s);
    // from_str maps unknown names to off; only accept "off" when asked for.
    if (lvl == spdlog::level::off && s != "off") return false;
    out = lvl;
    return true;
}

} // namespace ef
