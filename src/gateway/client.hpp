#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "gateway/tool.hpp"
#include "gateway/transport.hpp"

namespace swarm::gateway {

using json = nlohmann::json;

// How a candidate convention sends its request body
enum class PayloadShape { None, Json };

// How a candidate convention returns its result
enum class ResponseMode { Json, EventStream };

// One calling convention the tool server might speak
struct ProbeStrategy {
  std::string method;
  std::string path;  // Relative to the base URL
  PayloadShape payload = PayloadShape::Json;
  ResponseMode response = ResponseMode::Json;
};

std::string to_string(ResponseMode mode);

// Candidate conventions in priority order
const std::vector<ProbeStrategy> &list_strategies();
const std::vector<ProbeStrategy> &describe_strategies();
const std::vector<ProbeStrategy> &invoke_strategies();

// Event stream framing
constexpr const char *kDataPrefix = "data:";
constexpr const char *kStreamSentinel = "[DONE]";

struct GatewayOptions {
  std::optional<std::string> base_url;  // Absent disables the client
  std::chrono::milliseconds attempt_timeout{12000};
  std::map<std::string, std::string> headers;  // Sent with every attempt
};

// Client for a remote tool server whose wire convention is not known up front.
//
// Every operation walks its strategy table in order and returns the first
// well-formed response. There is no memory of which convention worked last
// time: each call probes from the top again. Worst-case latency of one call
// is (candidates x attempt_timeout).
//
// Immutable after construction; safe to share between concurrent pipeline runs.
class ToolGatewayClient {
 public:
  explicit ToolGatewayClient(GatewayOptions options, std::shared_ptr<Transport> transport = nullptr);

  bool enabled() const {
    return base_url_.has_value();
  }

  // Empty when disabled
  std::string base_url() const {
    return base_url_.value_or("");
  }

  std::chrono::milliseconds attempt_timeout() const {
    return options_.attempt_timeout;
  }

  // Throws ConfigurationError when disabled. Otherwise never throws: a server
  // that offers no tools under any convention yields an empty list.
  std::vector<ToolDescriptor> list_tools() const;

  // Throws ConfigurationError when disabled, GatewayError when every convention fails
  json describe_tool(const std::string &name) const;

  // Throws ConfigurationError when disabled, GatewayError when every convention fails.
  // The server's response document is returned verbatim.
  json invoke_tool(const std::string &name, const json &arguments = json::object()) const;

 private:
  void require_enabled() const;

  // Walk `strategies` until one attempt succeeds; throws the last GatewayError otherwise
  json probe(const std::vector<ProbeStrategy> &strategies, const json &payload, const std::string &operation) const;

  // One convention; throws GatewayError on any failure
  json attempt(const ProbeStrategy &strategy, const json &payload) const;
  json request_json(const ProbeStrategy &strategy, const json &payload) const;
  json request_event_stream(const ProbeStrategy &strategy, const json &payload) const;

  net::HttpOptions make_options(const ProbeStrategy &strategy, const json &payload) const;

  GatewayOptions options_;
  std::optional<std::string> base_url_;
  std::shared_ptr<Transport> transport_;
};

}  // namespace swarm::gateway
