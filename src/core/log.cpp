#include "core/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>

namespace swarm {

spdlog::level::level_enum parse_log_level(const std::string &level) {
  std::string lowered = level;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (lowered == "trace") return spdlog::level::trace;
  if (lowered == "debug") return spdlog::level::debug;
  if (lowered == "info") return spdlog::level::info;
  if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
  if (lowered == "error") return spdlog::level::err;
  if (lowered == "critical") return spdlog::level::critical;
  if (lowered == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void init_logging(const std::string &level) {
  auto logger = spdlog::get("swarm");
  if (!logger) {
    logger = spdlog::stderr_color_mt("swarm");
  }
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %^%l%$ %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(parse_log_level(level));
}

}  // namespace swarm
