#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace swarm::gateway {

using json = nlohmann::json;

// Remote tool definition as reported by the tool server
struct ToolDescriptor {
  std::string name;
  std::string description;
  json input_schema = json::object();  // Opaque, never validated here

  bool operator==(const ToolDescriptor &other) const {
    return name == other.name && description == other.description && input_schema == other.input_schema;
  }
};

void to_json(json &j, const ToolDescriptor &tool);

// Build a descriptor from one entry of a list response.
// Returns nullopt for entries that are not objects or lack a non-empty string "name".
std::optional<ToolDescriptor> parse_tool_descriptor(const json &item);

// Descriptors under the "tools" key of a list response, invalid entries dropped
std::vector<ToolDescriptor> parse_tool_list(const json &response);

}  // namespace swarm::gateway
