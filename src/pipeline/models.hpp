#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace swarm::pipeline {

using json = nlohmann::json;

struct TicketRequest {
  static constexpr std::size_t kMinMessageLength = 8;

  std::string ticket_id;
  std::string customer_name;
  std::string company;
  std::string message;
  Tone preferred_tone = Tone::Friendly;
  std::optional<std::string> urgency_hint;
  json metadata = json::object();

  // Validate and build from the wire shape; the error names the offending field
  static Result<TicketRequest> from_json(const json &j);
};

struct TriageResult {
  Urgency urgency = Urgency::Low;
  std::string reason;
  double confidence = 0.0;
  int sla_target_minutes = 0;
};

struct ResearchResult {
  std::vector<std::string> retrieved_notes;  // "[source] text"
  bool web_lookup_needed = false;
  std::string synthesis;
  std::vector<std::string> tool_actions;
};

struct ResponseDraft {
  std::string subject;
  std::string message;
  std::vector<std::string> suggested_actions;
};

struct EscalationDecision {
  bool escalate = false;
  RouteTarget route_to = RouteTarget::None;
  std::string reason;
  std::vector<std::string> tool_actions;
};

struct SwarmRunResult {
  std::string ticket_id;
  TriageResult triage;
  ResearchResult research;
  ResponseDraft response;
  EscalationDecision escalation;
  std::chrono::system_clock::time_point generated_at;
  std::string orchestration;
  std::string trace_id;
};

void to_json(json &j, const TicketRequest &ticket);
void to_json(json &j, const TriageResult &triage);
void to_json(json &j, const ResearchResult &research);
void to_json(json &j, const ResponseDraft &response);
void to_json(json &j, const EscalationDecision &escalation);
void to_json(json &j, const SwarmRunResult &result);

// UTC, ISO-8601 with microseconds: 2024-05-01T12:00:00.000000Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);

}  // namespace swarm::pipeline
