#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "augment/augmenter.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/uuid.hpp"
#include "core/version.hpp"
#include "gateway/client.hpp"
#include "gateway/operations.hpp"
#include "knowledge/memory_store.hpp"
#include "pipeline/orchestrator.hpp"

using namespace swarm;
using json = nlohmann::json;

namespace {

constexpr int kExitInternal = 1;
constexpr int kExitGateway = 2;
constexpr int kExitInvalid = 3;

// Thrown for bad command-line input and invalid documents
class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

void print_usage() {
  std::cout << "Usage: support-swarm [--config <file>] [--log-level <level>] <command> [args]\n"
               "\n"
               "Commands:\n"
               "  run <ticket.json|->                 Run the support pipeline on a ticket\n"
               "  tools list                          List tools offered by the tool server\n"
               "  tools describe <name>               Describe one tool\n"
               "  tools invoke <name> [args-json]     Invoke a tool\n"
               "  gateway <request.json|->            Execute a raw gateway request\n"
               "  kb search <query> [--limit n]       Search the knowledge store (n: 1-10)\n"
               "  health                              Print service status\n"
               "\n"
               "Options:\n"
               "  --config <file>       Config file (default ~/.config/support-swarm/config.json)\n"
               "  --log-level <level>   trace, debug, info, warn, error, critical, off\n"
               "  --version             Print version\n"
               "  --help                Show this help\n"
               "\n"
               "Environment:\n"
               "  SWARM_TOOL_SERVER_URL   Tool server base URL (MCP_SERVER_URL also accepted)\n"
               "  SWARM_LOG_LEVEL         Log level (LOG_LEVEL also accepted)\n";
}

// Reads a JSON document from a path, or stdin for "-"
json read_json_document(const std::string &source) {
  std::string text;
  if (source == "-") {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else {
    std::ifstream file(source);
    if (!file.is_open()) {
      throw UsageError("Cannot open " + source);
    }
    text.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }

  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    throw UsageError("Invalid JSON in " + (source == "-" ? std::string("stdin") : source));
  }
  return j;
}

void print_error(const std::string &detail) {
  json err = {{"detail", detail}, {"trace_id", generate_uuid()}};
  std::cerr << err.dump(2) << std::endl;
}

// Process-wide collaborators, built once in main and passed by reference
struct Services {
  Config config;
  knowledge::MemoryKnowledgeStore store;
  std::unique_ptr<gateway::ToolGatewayClient> gateway;
  augment::NullAugmenter augmenter;
};

void init_services(Services &services) {
  services.store.seed_default();
  for (const auto &path : services.config.knowledge_files) {
    auto loaded = services.store.load_file(path);
    if (!loaded.ok()) {
      throw UsageError(loaded.error.value_or("Failed to load " + path.string()));
    }
  }

  gateway::GatewayOptions options;
  options.base_url = services.config.gateway.server_url;
  options.attempt_timeout = std::chrono::milliseconds(services.config.gateway.attempt_timeout_ms);
  options.headers = services.config.gateway.headers;
  services.gateway = std::make_unique<gateway::ToolGatewayClient>(std::move(options));
}

int cmd_run(Services &services, const std::vector<std::string> &args) {
  if (args.empty()) {
    throw UsageError("run requires a ticket file or '-'");
  }

  auto ticket = pipeline::TicketRequest::from_json(read_json_document(args[0]));
  if (!ticket.ok()) {
    throw UsageError(ticket.error.value_or("Invalid ticket"));
  }

  pipeline::OrchestratorOptions options;
  options.research_limit = services.config.pipeline.research_limit;
  options.notify_recipient = services.config.pipeline.notify_recipient;
  options.parallel_escalation = services.config.pipeline.parallel_escalation;

  pipeline::Orchestrator orchestrator(services.store, *services.gateway, services.augmenter, options);
  auto result = orchestrator.run(*ticket.value);
  std::cout << json(result).dump(2) << std::endl;
  return 0;
}

int run_gateway_request(Services &services, const json &request_json) {
  std::cout << gateway::execute(*services.gateway, request_json).dump(2) << std::endl;
  return 0;
}

int cmd_tools(Services &services, const std::vector<std::string> &args) {
  if (args.empty()) {
    throw UsageError("tools requires a subcommand: list, describe, invoke");
  }

  json request;
  const auto &sub = args[0];
  if (sub == "list") {
    request = {{"operation", "list_tools"}};
  } else if (sub == "describe") {
    if (args.size() < 2) throw UsageError("tools describe requires a tool name");
    request = {{"operation", "describe_tool"}, {"name", args[1]}};
  } else if (sub == "invoke") {
    if (args.size() < 2) throw UsageError("tools invoke requires a tool name");
    json arguments = json::object();
    if (args.size() >= 3) {
      arguments = json::parse(args[2], nullptr, false);
      if (arguments.is_discarded() || !arguments.is_object()) {
        throw UsageError("Tool arguments must be a JSON object");
      }
    }
    request = {{"operation", "invoke_tool"}, {"name", args[1]}, {"arguments", arguments}};
  } else {
    throw UsageError("Unknown tools subcommand: " + sub);
  }
  return run_gateway_request(services, request);
}

int cmd_gateway(Services &services, const std::vector<std::string> &args) {
  if (args.empty()) {
    throw UsageError("gateway requires a request file or '-'");
  }
  return run_gateway_request(services, read_json_document(args[0]));
}

int cmd_kb(Services &services, const std::vector<std::string> &args) {
  if (args.empty() || args[0] != "search") {
    throw UsageError("kb requires the 'search' subcommand");
  }

  std::string query;
  int limit = 3;
  for (size_t i = 1; i < args.size(); ++i) {
    if (args[i] == "--limit" && i + 1 < args.size()) {
      try {
        limit = std::stoi(args[++i]);
      } catch (const std::exception &) {
        throw UsageError("--limit expects a number");
      }
    } else {
      if (!query.empty()) query += " ";
      query += args[i];
    }
  }
  if (query.empty()) throw UsageError("kb search requires a query");
  if (limit < 1 || limit > 10) throw UsageError("--limit must be between 1 and 10");

  auto out = knowledge::search_results_json(services.store.search(query, limit));
  std::cout << out.dump(2) << std::endl;
  return 0;
}

int cmd_health(Services &services) {
  json out = {{"ok", true}, {"kb_docs", services.store.size()}, {"tool_gateway_enabled", services.gateway->enabled()}};
  std::cout << out.dump(2) << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
  std::optional<std::string> config_path;
  std::optional<std::string> log_level;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
    if (arg == "--version") {
      std::cout << "support-swarm " << kVersion << std::endl;
      return 0;
    }
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    print_usage();
    return kExitInvalid;
  }

  Services services;
  try {
    if (config_path) {
      try {
        services.config = Config::load(*config_path);
      } catch (const std::runtime_error &e) {
        throw UsageError(e.what());
      }
      services.config.apply_env();
    } else {
      services.config = Config::load_default();
    }
    if (log_level) {
      services.config.log_level = *log_level;
    }
    init_logging(services.config.log_level);
    init_services(services);

    const std::string command = positional[0];
    std::vector<std::string> args(positional.begin() + 1, positional.end());

    if (command == "run") return cmd_run(services, args);
    if (command == "tools") return cmd_tools(services, args);
    if (command == "gateway") return cmd_gateway(services, args);
    if (command == "kb") return cmd_kb(services, args);
    if (command == "health") return cmd_health(services);

    throw UsageError("Unknown command: " + command);
  } catch (const UsageError &e) {
    print_error(e.what());
    return kExitInvalid;
  } catch (const RequestError &e) {
    print_error(e.what());
    return kExitInvalid;
  } catch (const ConfigurationError &e) {
    print_error(e.what());
    return kExitInvalid;
  } catch (const GatewayError &e) {
    spdlog::error("[Gateway] {}", e.what());
    print_error(e.what());
    return kExitGateway;
  } catch (const std::exception &e) {
    spdlog::error("Unhandled error: {}", e.what());
    print_error("Internal error");
    return kExitInternal;
  }
}
