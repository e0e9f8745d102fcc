#pragma once

#include <optional>
#include <string>
#include <vector>

#include "gateway/tool.hpp"

namespace swarm::gateway {

// Maps an intent (a keyword set) to a concrete tool name so callers never
// hard-code remote tool names. Matching is a case-insensitive substring test
// against "name description"; the first matching tool in list order wins.
class KeywordToolResolver {
 public:
  explicit KeywordToolResolver(std::vector<std::string> keywords);

  std::optional<std::string> resolve(const std::vector<ToolDescriptor> &tools) const;

  const std::vector<std::string> &keywords() const {
    return keywords_;
  }

  // {"web", "search", "knowledge"}
  static KeywordToolResolver web_research();
  // {"ticket", "database", "crm", "update"}
  static KeywordToolResolver ticket_update();
  // {"email", "notify", "slack", "teams"}
  static KeywordToolResolver notification();

 private:
  std::vector<std::string> keywords_;  // Lower-cased
};

}  // namespace swarm::gateway
