#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "core/types.hpp"
#include "gateway/client.hpp"

namespace swarm::gateway {

using json = nlohmann::json;

enum class GatewayOperation { ListTools, DescribeTool, InvokeTool };

std::string to_string(GatewayOperation op);
std::optional<GatewayOperation> parse_gateway_operation(const std::string &value);

// Operator request against the gateway: {"operation", "name", "arguments"}
struct GatewayRequest {
  GatewayOperation operation = GatewayOperation::ListTools;
  std::optional<std::string> name;
  json arguments = json::object();

  // Validates the operation and that describe/invoke carry a tool name
  static Result<GatewayRequest> from_json(const json &j);
};

// Execute a request and wrap the result as {"operation", "data"}.
// list_tools data is {"tools": [...]}; describe and invoke data is the server document.
// Throws ConfigurationError when the client is disabled and GatewayError from describe/invoke.
json dispatch(const ToolGatewayClient &client, const GatewayRequest &request);

// Validate and dispatch a raw request document. A disabled client is reported
// (ConfigurationError) before the request is checked (RequestError).
json execute(const ToolGatewayClient &client, const json &request);

}  // namespace swarm::gateway
