#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace swarm {

using json = nlohmann::json;

// Tool server connection settings
struct GatewayConfig {
  std::optional<std::string> server_url;  // Absent disables every tool operation
  int attempt_timeout_ms = 12000;         // Budget for one convention attempt
  std::map<std::string, std::string> headers;
};

struct PipelineConfig {
  int research_limit = 3;
  std::string notify_recipient = "support-leads@company.com";
  bool parallel_escalation = true;
};

struct Config {
  std::string log_level = "info";
  GatewayConfig gateway;
  PipelineConfig pipeline;
  std::vector<std::filesystem::path> knowledge_files;

  // Load from a JSON file. Missing keys keep their defaults.
  // Throws std::runtime_error if the file cannot be read or parsed.
  static Config load(const std::filesystem::path &path);

  // ~/.config/support-swarm/config.json if present, then environment overrides
  static Config load_default();

  // Apply SWARM_TOOL_SERVER_URL / MCP_SERVER_URL and SWARM_LOG_LEVEL / LOG_LEVEL
  void apply_env();

  void save(const std::filesystem::path &path) const;
};

void to_json(json &j, const Config &config);
void from_json(const json &j, Config &config);

// Trim whitespace and trailing slashes; empty input means "not configured"
std::optional<std::string> normalize_server_url(const std::string &url);

namespace config_paths {

std::filesystem::path home_dir();

// ~/.config/support-swarm
std::filesystem::path config_dir();

std::filesystem::path config_file();

}  // namespace config_paths

}  // namespace swarm
