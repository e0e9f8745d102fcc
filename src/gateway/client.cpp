#include "gateway/client.hpp"

#include <spdlog/spdlog.h>

#include <cstring>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "net/sse_parser.hpp"

namespace swarm::gateway {

namespace {

constexpr std::size_t kErrorBodyPreview = 200;

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

std::string describe_http_failure(const net::HttpResponse &response) {
  if (!response.error.empty()) {
    return response.error;
  }
  std::string cause = "HTTP " + std::to_string(response.status_code);
  if (!response.body.empty()) {
    cause += ": " + response.body.substr(0, kErrorBodyPreview);
  }
  return cause;
}

}  // namespace

std::string to_string(ResponseMode mode) {
  switch (mode) {
    case ResponseMode::Json:
      return "json";
    case ResponseMode::EventStream:
      return "event-stream";
  }
  return "unknown";
}

// ============================================================
// Strategy tables
// ============================================================

const std::vector<ProbeStrategy> &list_strategies() {
  static const std::vector<ProbeStrategy> strategies = {
      {"GET", "/tools", PayloadShape::None, ResponseMode::Json},
      {"POST", "/tools/list", PayloadShape::Json, ResponseMode::Json},
      {"POST", "/mcp/list_tools", PayloadShape::Json, ResponseMode::Json},
      {"POST", "/sse/list_tools", PayloadShape::Json, ResponseMode::EventStream},
  };
  return strategies;
}

const std::vector<ProbeStrategy> &describe_strategies() {
  static const std::vector<ProbeStrategy> strategies = {
      {"POST", "/tools/describe", PayloadShape::Json, ResponseMode::Json},
      {"POST", "/mcp/describe_tool", PayloadShape::Json, ResponseMode::Json},
      {"POST", "/sse/describe_tool", PayloadShape::Json, ResponseMode::EventStream},
  };
  return strategies;
}

const std::vector<ProbeStrategy> &invoke_strategies() {
  static const std::vector<ProbeStrategy> strategies = {
      {"POST", "/tools/invoke", PayloadShape::Json, ResponseMode::Json},
      {"POST", "/mcp/invoke_tool", PayloadShape::Json, ResponseMode::Json},
      {"POST", "/sse/invoke_tool", PayloadShape::Json, ResponseMode::EventStream},
  };
  return strategies;
}

// ============================================================
// ToolGatewayClient
// ============================================================

ToolGatewayClient::ToolGatewayClient(GatewayOptions options, std::shared_ptr<Transport> transport)
    : options_(std::move(options)), transport_(std::move(transport)) {
  if (options_.base_url.has_value()) {
    base_url_ = normalize_server_url(*options_.base_url);
  }
  if (!transport_) {
    transport_ = std::make_shared<HttpTransport>();
  }

  if (base_url_) {
    spdlog::info("[Gateway] Tool server configured at {}", *base_url_);
  } else {
    spdlog::info("[Gateway] No tool server configured, tool use disabled");
  }
}

void ToolGatewayClient::require_enabled() const {
  if (!enabled()) {
    throw ConfigurationError("Tool server URL is not configured.");
  }
}

std::vector<ToolDescriptor> ToolGatewayClient::list_tools() const {
  require_enabled();

  for (const auto &strategy : list_strategies()) {
    try {
      auto tools = parse_tool_list(attempt(strategy, json::object()));
      if (!tools.empty()) {
        spdlog::debug("[Gateway] {} {} listed {} tools", strategy.method, strategy.path, tools.size());
        return tools;
      }
      spdlog::debug("[Gateway] {} {} returned no usable tools", strategy.method, strategy.path);
    } catch (const GatewayError &e) {
      spdlog::debug("[Gateway] list_tools via {} failed: {}", strategy.path, e.cause());
    }
  }

  spdlog::warn("[Gateway] No tools available from {}", *base_url_);
  return {};
}

json ToolGatewayClient::describe_tool(const std::string &name) const {
  require_enabled();
  return probe(describe_strategies(), json{{"name", name}}, "describe tool '" + name + "'");
}

json ToolGatewayClient::invoke_tool(const std::string &name, const json &arguments) const {
  require_enabled();
  json args = arguments.is_null() ? json::object() : arguments;
  return probe(invoke_strategies(), json{{"name", name}, {"arguments", args}}, "invoke tool '" + name + "'");
}

json ToolGatewayClient::probe(const std::vector<ProbeStrategy> &strategies, const json &payload, const std::string &operation) const {
  std::string last_path;
  std::string last_cause = "no conventions configured";

  for (const auto &strategy : strategies) {
    try {
      return attempt(strategy, payload);
    } catch (const GatewayError &e) {
      spdlog::debug("[Gateway] {} via {} failed: {}", operation, strategy.path, e.cause());
      last_path = e.path();
      last_cause = e.cause();
    }
  }

  spdlog::warn("[Gateway] Unable to {}: every convention failed (last {}: {})", operation, last_path, last_cause);
  throw GatewayError(last_path, "Unable to " + operation + ": " + last_cause);
}

json ToolGatewayClient::attempt(const ProbeStrategy &strategy, const json &payload) const {
  try {
    if (strategy.response == ResponseMode::EventStream) {
      return request_event_stream(strategy, payload);
    }
    return request_json(strategy, payload);
  } catch (const GatewayError &) {
    throw;
  } catch (const std::exception &e) {
    throw GatewayError(strategy.path, e.what());
  }
}

net::HttpOptions ToolGatewayClient::make_options(const ProbeStrategy &strategy, const json &payload) const {
  net::HttpOptions opts;
  opts.method = strategy.method;
  opts.timeout = options_.attempt_timeout;
  opts.headers = options_.headers;
  opts.headers["Accept"] = strategy.response == ResponseMode::EventStream ? "text/event-stream" : "application/json";
  if (strategy.payload == PayloadShape::Json) {
    opts.headers["Content-Type"] = "application/json";
    opts.body = payload.dump();
  }
  return opts;
}

json ToolGatewayClient::request_json(const ProbeStrategy &strategy, const json &payload) const {
  auto response = transport_->send(*base_url_ + strategy.path, make_options(strategy, payload));
  if (!response.ok()) {
    throw GatewayError(strategy.path, describe_http_failure(response));
  }

  auto data = json::parse(response.body, nullptr, false);
  if (data.is_discarded()) {
    throw GatewayError(strategy.path, "Response body is not valid JSON");
  }
  if (!data.is_object()) {
    return json{{"data", data}};
  }
  return data;
}

json ToolGatewayClient::request_event_stream(const ProbeStrategy &strategy, const json &payload) const {
  std::optional<json> result;
  bool saw_sentinel = false;
  const std::size_t prefix_len = std::strlen(kDataPrefix);

  net::SseLineReader reader;
  auto on_line = [&](const std::string &line) -> bool {
    if (line.compare(0, prefix_len, kDataPrefix) != 0) {
      return true;
    }

    std::string raw = trim(line.substr(prefix_len));
    if (raw == kStreamSentinel) {
      saw_sentinel = true;
      return false;
    }

    auto parsed = json::parse(raw, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      spdlog::warn("[Gateway] Skipping non-JSON event payload from {}", strategy.path);
      return true;
    }
    result = std::move(parsed);
    return false;
  };

  auto opts = make_options(strategy, payload);
  opts.on_data = [&](std::string_view chunk) {
    return reader.feed(chunk, on_line);
  };

  auto response = transport_->send(*base_url_ + strategy.path, opts);

  // First JSON payload wins even if the connection broke afterwards
  if (!result && !saw_sentinel && response.ok()) {
    reader.flush(on_line);
  }
  if (result) {
    return *result;
  }
  if (!response.ok()) {
    throw GatewayError(strategy.path, describe_http_failure(response));
  }
  throw GatewayError(strategy.path, "No JSON event payload returned by event stream");
}

}  // namespace swarm::gateway
