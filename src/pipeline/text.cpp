#include "pipeline/text.hpp"

#include <algorithm>
#include <cctype>

namespace swarm::pipeline {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

bool contains_any(const std::string &haystack, const std::vector<std::string> &needles) {
  return std::any_of(needles.begin(), needles.end(), [&](const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
  });
}

}  // namespace swarm::pipeline
