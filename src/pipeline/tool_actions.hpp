#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "gateway/client.hpp"
#include "gateway/resolver.hpp"

namespace swarm::pipeline {

using json = nlohmann::json;

// Best-effort tool use for pipeline stages. Gateway failures never escape:
// they are logged and reported as "no action taken" (nullopt).
class ToolActions {
 public:
  explicit ToolActions(const gateway::ToolGatewayClient &client) : client_(client) {}

  bool available() const {
    return client_.enabled();
  }

  // Tool matching the resolver's intent, or nullopt when the gateway is
  // disabled, offers no tools, or none match
  std::optional<std::string> resolve(const gateway::KeywordToolResolver &resolver) const;

  // Describe, then invoke. nullopt if either step fails or the tool
  // returns an empty result.
  std::optional<json> invoke(const std::string &tool_name, const json &arguments) const;

  // Log line recorded for a successful invocation
  static std::string action_record(const std::string &tool_name) {
    return "Invoked tool: " + tool_name;
  }

 private:
  const gateway::ToolGatewayClient &client_;
};

}  // namespace swarm::pipeline
