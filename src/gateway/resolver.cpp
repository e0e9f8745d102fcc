#include "gateway/resolver.hpp"

#include <algorithm>
#include <cctype>

namespace swarm::gateway {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

}  // namespace

KeywordToolResolver::KeywordToolResolver(std::vector<std::string> keywords) {
  for (auto &keyword : keywords) {
    if (!keyword.empty()) {
      keywords_.push_back(to_lower(std::move(keyword)));
    }
  }
}

std::optional<std::string> KeywordToolResolver::resolve(const std::vector<ToolDescriptor> &tools) const {
  for (const auto &tool : tools) {
    std::string haystack = to_lower(tool.name + " " + tool.description);
    for (const auto &keyword : keywords_) {
      if (haystack.find(keyword) != std::string::npos) {
        return tool.name;
      }
    }
  }
  return std::nullopt;
}

KeywordToolResolver KeywordToolResolver::web_research() {
  return KeywordToolResolver({"web", "search", "knowledge"});
}

KeywordToolResolver KeywordToolResolver::ticket_update() {
  return KeywordToolResolver({"ticket", "database", "crm", "update"});
}

KeywordToolResolver KeywordToolResolver::notification() {
  return KeywordToolResolver({"email", "notify", "slack", "teams"});
}

}  // namespace swarm::gateway
