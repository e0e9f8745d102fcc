#include "gateway/operations.hpp"

#include "core/errors.hpp"

namespace swarm::gateway {

std::string to_string(GatewayOperation op) {
  switch (op) {
    case GatewayOperation::ListTools:
      return "list_tools";
    case GatewayOperation::DescribeTool:
      return "describe_tool";
    case GatewayOperation::InvokeTool:
      return "invoke_tool";
  }
  return "unknown";
}

std::optional<GatewayOperation> parse_gateway_operation(const std::string &value) {
  if (value == "list_tools") return GatewayOperation::ListTools;
  if (value == "describe_tool") return GatewayOperation::DescribeTool;
  if (value == "invoke_tool") return GatewayOperation::InvokeTool;
  return std::nullopt;
}

Result<GatewayRequest> GatewayRequest::from_json(const json &j) {
  if (!j.is_object()) {
    return Result<GatewayRequest>::failure("Gateway request must be a JSON object.");
  }

  auto op_it = j.find("operation");
  if (op_it == j.end() || !op_it->is_string()) {
    return Result<GatewayRequest>::failure("Field 'operation' is required.");
  }
  auto op = parse_gateway_operation(op_it->get<std::string>());
  if (!op) {
    return Result<GatewayRequest>::failure("Unsupported operation: " + op_it->get<std::string>());
  }

  GatewayRequest req;
  req.operation = *op;

  auto name_it = j.find("name");
  if (name_it != j.end() && name_it->is_string() && !name_it->get<std::string>().empty()) {
    req.name = name_it->get<std::string>();
  }

  auto args_it = j.find("arguments");
  if (args_it != j.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      return Result<GatewayRequest>::failure("Field 'arguments' must be an object.");
    }
    req.arguments = *args_it;
  }

  if (req.operation != GatewayOperation::ListTools && !req.name) {
    return Result<GatewayRequest>::failure("Tool name is required for " + to_string(req.operation) + ".");
  }
  return Result<GatewayRequest>::success(std::move(req));
}

json dispatch(const ToolGatewayClient &client, const GatewayRequest &request) {
  if (!client.enabled()) {
    throw ConfigurationError("Tool server URL is not configured.");
  }

  json data;
  switch (request.operation) {
    case GatewayOperation::ListTools: {
      json tools = json::array();
      for (const auto &tool : client.list_tools()) {
        tools.push_back(json(tool));
      }
      data = json{{"tools", tools}};
      break;
    }
    case GatewayOperation::DescribeTool:
      data = client.describe_tool(request.name.value_or(""));
      break;
    case GatewayOperation::InvokeTool:
      data = client.invoke_tool(request.name.value_or(""), request.arguments);
      break;
  }
  return json{{"operation", to_string(request.operation)}, {"data", data}};
}

json execute(const ToolGatewayClient &client, const json &request) {
  if (!client.enabled()) {
    throw ConfigurationError("Tool server URL is not configured.");
  }
  auto parsed = GatewayRequest::from_json(request);
  if (!parsed.ok()) {
    throw RequestError(parsed.error.value_or("Invalid gateway request"));
  }
  return dispatch(client, *parsed.value);
}

}  // namespace swarm::gateway
