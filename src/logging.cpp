#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace espfleet {

bool parse_log_level(const std::string& name, spdlog::level::level_enum& level) {
    static const struct { const char* name; spdlog::level::level_enum level; } kLevels[] = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn}, {"error", spdlog::level::err},
        {"critical", spdlog::level::critical}, {"off", spdlog::level::off},
    };
    for (const auto& entry : kLevels) {
        if (name == entry.name) {
            level = entry.level;
            return true;
        }
    }
    return false;
}

std::string effective_log_level(const std::string& flag_level, int verbosity, const char* env_level) {
    if (!flag_level.empty()) return flag_level;
    if (verbosity >= 2) return "trace";
    if (verbosity == 1) return "debug";
    if (env_level && *env_level) return env_level;
    return "warn";
}

Status init_logging(const std::string& level_name) {
    spdlog::level::level_enum level = spdlog::level::warn;
    const bool known = parse_log_level(level_name, level);

    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    auto logger = std::make_shared<spdlog::logger>("espfleet", sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);

    if (!known) {
        return Status::error(ErrorKind::Usage, "bad_log_level",
                             "unknown log level '" + level_name + "' (trace, debug, info, warn, error, critical, off)");
    }
    return Status::success();
}

} // namespace espfleet
