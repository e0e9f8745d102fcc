#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace swarm {

// Map a config level name to spdlog; unknown names fall back to info
spdlog::level::level_enum parse_log_level(const std::string &level);

// Route the default logger to stderr with a timestamped pattern and set its level.
// stdout is reserved for command output.
void init_logging(const std::string &level);

}  // namespace swarm
