#include "pipeline/models.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "core/utf8.hpp"

namespace swarm::pipeline {

namespace {

// Required string field; empty is allowed unless `non_empty`
std::optional<std::string> read_string(const json &j, const char *key, bool non_empty, std::string &error) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    error = std::string("Field '") + key + "' is required.";
    return std::nullopt;
  }
  if (!it->is_string()) {
    error = std::string("Field '") + key + "' must be a string.";
    return std::nullopt;
  }
  auto value = it->get<std::string>();
  if (non_empty && value.empty()) {
    error = std::string("Field '") + key + "' must not be empty.";
    return std::nullopt;
  }
  return value;
}

}  // namespace

// ============================================================
// TicketRequest
// ============================================================

Result<TicketRequest> TicketRequest::from_json(const json &j) {
  using R = Result<TicketRequest>;
  if (!j.is_object()) {
    return R::failure("Ticket must be a JSON object.");
  }

  std::string error;
  TicketRequest ticket;

  auto id = read_string(j, "ticket_id", true, error);
  if (!id) return R::failure(error);
  ticket.ticket_id = *id;

  auto customer = read_string(j, "customer_name", false, error);
  if (!customer) return R::failure(error);
  ticket.customer_name = *customer;

  auto company = read_string(j, "company", false, error);
  if (!company) return R::failure(error);
  ticket.company = *company;

  auto message = read_string(j, "message", false, error);
  if (!message) return R::failure(error);
  if (utf8_length(*message) < kMinMessageLength) {
    return R::failure("Field 'message' must be at least " + std::to_string(kMinMessageLength) + " characters.");
  }
  ticket.message = *message;

  auto tone_it = j.find("preferred_tone");
  if (tone_it != j.end() && !tone_it->is_null()) {
    std::optional<Tone> tone;
    if (tone_it->is_string()) {
      tone = parse_tone(tone_it->get<std::string>());
    }
    if (!tone) {
      return R::failure("Field 'preferred_tone' must be one of friendly, formal, direct.");
    }
    ticket.preferred_tone = *tone;
  }

  auto hint_it = j.find("urgency_hint");
  if (hint_it != j.end() && !hint_it->is_null()) {
    if (!hint_it->is_string()) {
      return R::failure("Field 'urgency_hint' must be a string.");
    }
    ticket.urgency_hint = hint_it->get<std::string>();
  }

  auto meta_it = j.find("metadata");
  if (meta_it != j.end() && !meta_it->is_null()) {
    if (!meta_it->is_object()) {
      return R::failure("Field 'metadata' must be an object.");
    }
    ticket.metadata = *meta_it;
  }

  return R::success(std::move(ticket));
}

// ============================================================
// JSON output
// ============================================================

void to_json(json &j, const TicketRequest &ticket) {
  j = json{{"ticket_id", ticket.ticket_id},
           {"customer_name", ticket.customer_name},
           {"company", ticket.company},
           {"message", ticket.message},
           {"preferred_tone", to_string(ticket.preferred_tone)},
           {"urgency_hint", ticket.urgency_hint.has_value() ? json(*ticket.urgency_hint) : json(nullptr)},
           {"metadata", ticket.metadata}};
}

void to_json(json &j, const TriageResult &triage) {
  j = json{{"urgency", to_string(triage.urgency)},
           {"reason", triage.reason},
           {"confidence", triage.confidence},
           {"sla_target_minutes", triage.sla_target_minutes}};
}

void to_json(json &j, const ResearchResult &research) {
  j = json{{"retrieved_notes", research.retrieved_notes},
           {"web_lookup_needed", research.web_lookup_needed},
           {"synthesis", research.synthesis},
           {"tool_actions", research.tool_actions}};
}

void to_json(json &j, const ResponseDraft &response) {
  j = json{{"subject", response.subject}, {"message", response.message}, {"suggested_actions", response.suggested_actions}};
}

void to_json(json &j, const EscalationDecision &escalation) {
  j = json{{"escalate", escalation.escalate},
           {"route_to", to_string(escalation.route_to)},
           {"reason", escalation.reason},
           {"tool_actions", escalation.tool_actions}};
}

void to_json(json &j, const SwarmRunResult &result) {
  j = json{{"ticket_id", result.ticket_id},
           {"triage", result.triage},
           {"research", result.research},
           {"response", result.response},
           {"escalation", result.escalation},
           {"generated_at", format_timestamp(result.generated_at)},
           {"orchestration", result.orchestration},
           {"trace_id", result.trace_id}};
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds).count();
  if (micros < 0) {
    seconds -= std::chrono::seconds(1);
    micros += 1000000;
  }

  std::time_t t = std::chrono::system_clock::to_time_t(seconds);
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &t);
#else
  gmtime_r(&t, &utc);
#endif

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
  return out.str();
}

}  // namespace swarm::pipeline
