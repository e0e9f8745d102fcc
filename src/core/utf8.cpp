#include "core/utf8.hpp"

namespace swarm {

namespace {

bool is_continuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

std::size_t utf8_length(const std::string &text) {
  std::size_t count = 0;
  for (char c : text) {
    if (!is_continuation(c)) ++count;
  }
  return count;
}

std::string truncate_utf8(const std::string &text, std::size_t max_chars) {
  if (text.size() <= max_chars) return text;

  std::size_t seen = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (is_continuation(text[i])) continue;
    if (seen == max_chars) return text.substr(0, i);
    ++seen;
  }
  return text;
}

}  // namespace swarm
