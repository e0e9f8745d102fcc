#pragma once

#include <string>
#include <vector>

#include "core/utf8.hpp"

namespace swarm::pipeline {

std::string to_lower(std::string s);

// True if `haystack` contains any of `needles` as a substring
bool contains_any(const std::string &haystack, const std::vector<std::string> &needles);

}  // namespace swarm::pipeline
