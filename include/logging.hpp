#pragma once
/**
 * @file logging.hpp
 * @brief spdlog setup for the espfleet binary.
 *
 * Diagnostics go to stderr through one color sink so stdout stays clean for
 * key=value results. Level precedence: --log-level, then -v (-v debug,
 * -vv trace), then $ESPFLEET_LOG_LEVEL, then "warn".
 */

#include "espfleet/status.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace espfleet {

/// Map "trace|debug|info|warn|error|critical|off" to a level. False on anything else.
bool parse_log_level(const std::string& name, spdlog::level::level_enum& level);

/// Pick the effective level name from the three sources above.
std::string effective_log_level(const std::string& flag_level, int verbosity, const char* env_level);

/// Install the stderr logger as spdlog's default. Usage "bad_log_level" on an unknown name.
Status init_logging(const std::string& level_name);

} // namespace espfleet
