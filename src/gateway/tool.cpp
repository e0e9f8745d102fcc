#include "gateway/tool.hpp"

namespace swarm::gateway {

void to_json(json &j, const ToolDescriptor &tool) {
  j = json{{"name", tool.name}, {"description", tool.description}, {"input_schema", tool.input_schema}};
}

std::optional<ToolDescriptor> parse_tool_descriptor(const json &item) {
  if (!item.is_object()) return std::nullopt;

  auto name_it = item.find("name");
  if (name_it == item.end() || !name_it->is_string() || name_it->get<std::string>().empty()) {
    return std::nullopt;
  }

  ToolDescriptor tool;
  tool.name = name_it->get<std::string>();

  auto desc_it = item.find("description");
  if (desc_it != item.end() && desc_it->is_string()) {
    tool.description = desc_it->get<std::string>();
  }

  // Servers disagree on the schema key
  for (const char *key : {"input_schema", "inputSchema", "schema"}) {
    auto it = item.find(key);
    if (it != item.end() && !it->is_null()) {
      tool.input_schema = *it;
      break;
    }
  }
  return tool;
}

std::vector<ToolDescriptor> parse_tool_list(const json &response) {
  std::vector<ToolDescriptor> tools;
  if (!response.is_object()) return tools;

  auto it = response.find("tools");
  if (it == response.end() || !it->is_array()) return tools;

  for (const auto &item : *it) {
    if (auto tool = parse_tool_descriptor(item)) {
      tools.push_back(std::move(*tool));
    }
  }
  return tools;
}

}  // namespace swarm::gateway
