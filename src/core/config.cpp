#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace swarm {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr) return std::nullopt;
  return std::string(value);
}

}  // namespace

std::optional<std::string> normalize_server_url(const std::string &url) {
  auto begin = url.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return std::nullopt;
  auto end = url.find_last_not_of(" \t\r\n");
  std::string trimmed = url.substr(begin, end - begin + 1);
  while (!trimmed.empty() && trimmed.back() == '/') {
    trimmed.pop_back();
  }
  if (trimmed.empty()) return std::nullopt;
  return trimmed;
}

// ============================================================
// JSON mapping
// ============================================================

void to_json(json &j, const Config &config) {
  json gateway;
  gateway["server_url"] = config.gateway.server_url.has_value() ? json(*config.gateway.server_url) : json(nullptr);
  gateway["attempt_timeout_ms"] = config.gateway.attempt_timeout_ms;
  gateway["headers"] = config.gateway.headers;

  json pipeline;
  pipeline["research_limit"] = config.pipeline.research_limit;
  pipeline["notify_recipient"] = config.pipeline.notify_recipient;
  pipeline["parallel_escalation"] = config.pipeline.parallel_escalation;

  json files = json::array();
  for (const auto &path : config.knowledge_files) {
    files.push_back(path.string());
  }

  j = json{{"log_level", config.log_level}, {"gateway", gateway}, {"pipeline", pipeline}, {"knowledge_files", files}};
}

void from_json(const json &j, Config &config) {
  config.log_level = j.value("log_level", config.log_level);

  if (j.contains("gateway") && j["gateway"].is_object()) {
    const auto &g = j["gateway"];
    if (g.contains("server_url") && g["server_url"].is_string()) {
      config.gateway.server_url = normalize_server_url(g["server_url"].get<std::string>());
    }
    config.gateway.attempt_timeout_ms = g.value("attempt_timeout_ms", config.gateway.attempt_timeout_ms);
    if (g.contains("headers") && g["headers"].is_object()) {
      config.gateway.headers = g["headers"].get<std::map<std::string, std::string>>();
    }
  }

  if (j.contains("pipeline") && j["pipeline"].is_object()) {
    const auto &p = j["pipeline"];
    config.pipeline.research_limit = p.value("research_limit", config.pipeline.research_limit);
    config.pipeline.notify_recipient = p.value("notify_recipient", config.pipeline.notify_recipient);
    config.pipeline.parallel_escalation = p.value("parallel_escalation", config.pipeline.parallel_escalation);
  }

  if (j.contains("knowledge_files") && j["knowledge_files"].is_array()) {
    config.knowledge_files.clear();
    for (const auto &item : j["knowledge_files"]) {
      if (item.is_string()) {
        config.knowledge_files.emplace_back(item.get<std::string>());
      }
    }
  }
}

// ============================================================
// Config
// ============================================================

Config Config::load(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file: " + path.string());
  }

  json j = json::parse(file, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw std::runtime_error("Config file is not a JSON object: " + path.string());
  }

  Config config = j.get<Config>();

  // Relative knowledge files are resolved against the config file location
  for (auto &kb_path : config.knowledge_files) {
    if (kb_path.is_relative()) {
      kb_path = path.parent_path() / kb_path;
    }
  }
  return config;
}

Config Config::load_default() {
  Config config;

  auto path = config_paths::config_file();
  std::error_code ec;
  if (fs::exists(path, ec)) {
    try {
      config = load(path);
      spdlog::debug("[Config] Loaded {}", path.string());
    } catch (const std::exception &e) {
      spdlog::warn("[Config] Ignoring unreadable config {}: {}", path.string(), e.what());
    }
  }

  config.apply_env();
  return config;
}

void Config::apply_env() {
  if (auto url = env_value("SWARM_TOOL_SERVER_URL")) {
    gateway.server_url = normalize_server_url(*url);
  } else if (auto legacy = env_value("MCP_SERVER_URL")) {
    gateway.server_url = normalize_server_url(*legacy);
  }

  if (auto level = env_value("SWARM_LOG_LEVEL")) {
    log_level = *level;
  } else if (auto legacy = env_value("LOG_LEVEL")) {
    log_level = *legacy;
  }
}

void Config::save(const fs::path &path) const {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to write config file: " + path.string());
  }
  file << json(*this).dump(2) << "\n";
}

// ============================================================
// config_paths
// ============================================================

namespace config_paths {

fs::path home_dir() {
  if (auto home = env_value("HOME"); home && !home->empty()) {
    return fs::path(*home);
  }
  if (auto profile = env_value("USERPROFILE"); profile && !profile->empty()) {
    return fs::path(*profile);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "support-swarm";
}

fs::path config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

}  // namespace swarm
