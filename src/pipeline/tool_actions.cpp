#include "pipeline/tool_actions.hpp"

#include <spdlog/spdlog.h>

#include "core/errors.hpp"

namespace swarm::pipeline {

namespace {

// null, false, zero and empty containers or strings carry no result
bool is_empty_result(const json &output) {
  if (output.is_null()) return true;
  if (output.is_boolean()) return !output.get<bool>();
  if (output.is_number()) return output == 0;
  if (output.is_string()) return output.get_ref<const std::string &>().empty();
  return output.empty();
}

}  // namespace

std::optional<std::string> ToolActions::resolve(const gateway::KeywordToolResolver &resolver) const {
  if (!available()) return std::nullopt;

  try {
    return resolver.resolve(client_.list_tools());
  } catch (const ConfigurationError &e) {
    spdlog::warn("[Swarm] Tool discovery skipped: {}", e.what());
  } catch (const GatewayError &e) {
    spdlog::warn("[Swarm] Tool discovery failed: {}", e.what());
  }
  return std::nullopt;
}

std::optional<json> ToolActions::invoke(const std::string &tool_name, const json &arguments) const {
  if (!available()) return std::nullopt;

  try {
    client_.describe_tool(tool_name);
    auto output = client_.invoke_tool(tool_name, arguments);
    if (is_empty_result(output)) {
      spdlog::debug("[Swarm] Tool {} returned an empty result", tool_name);
      return std::nullopt;
    }
    return output;
  } catch (const ConfigurationError &e) {
    spdlog::warn("[Swarm] Tool {} skipped: {}", tool_name, e.what());
  } catch (const GatewayError &e) {
    spdlog::warn("[Swarm] Tool invoke failed for {}: {}", tool_name, e.what());
  }
  return std::nullopt;
}

}  // namespace swarm::pipeline
