#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace ef {

// Installs the "evidenceforge" stderr logger as spdlog's default.
void init_logging(spdlog::level::level_enum level = spdlog::level::info);

// "trace", "debug", "info", "warn", "error", "critical" or "off".
bool parse_log_level(const std::string& s, spdlog::level::level_enum& out);

} // namespace ef
