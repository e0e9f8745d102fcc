#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace swarm::net {

// Splits a server-sent event stream into lines as chunks arrive.
// Lines end at '\n'; a trailing '\r' is dropped. Chunk boundaries may fall anywhere.
class SseLineReader {
 public:
  // Return false from the handler to stop; remaining input is discarded.
  using LineHandler = std::function<bool(const std::string &line)>;

  // Returns false if the handler asked to stop
  bool feed(std::string_view chunk, const LineHandler &on_line);

  // Emit a final unterminated line, if any
  bool flush(const LineHandler &on_line);

  bool stopped() const {
    return stopped_;
  }

 private:
  std::string pending_;
  bool stopped_ = false;
};

}  // namespace swarm::net
