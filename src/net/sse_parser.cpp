#include "net/sse_parser.hpp"

namespace swarm::net {

bool SseLineReader::feed(std::string_view chunk, const LineHandler &on_line) {
  if (stopped_) return false;

  std::size_t start = 0;
  while (start < chunk.size()) {
    auto nl = chunk.find('\n', start);
    if (nl == std::string_view::npos) {
      pending_.append(chunk.substr(start));
      break;
    }

    pending_.append(chunk.substr(start, nl - start));
    start = nl + 1;

    std::string line = std::move(pending_);
    pending_.clear();
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!on_line(line)) {
      stopped_ = true;
      return false;
    }
  }
  return true;
}

bool SseLineReader::flush(const LineHandler &on_line) {
  if (stopped_ || pending_.empty()) return !stopped_;

  std::string line = std::move(pending_);
  pending_.clear();
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (!on_line(line)) {
    stopped_ = true;
    return false;
  }
  return true;
}

}  // namespace swarm::net
