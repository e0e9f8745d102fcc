#pragma once

#include <cstddef>
#include <string>

namespace swarm {

// Number of code points in UTF-8 `text`. Stray continuation bytes are not counted.
std::size_t utf8_length(const std::string &text);

// First `max_chars` code points of `text`, never splitting a UTF-8 sequence
std::string truncate_utf8(const std::string &text, std::size_t max_chars);

}  // namespace swarm
