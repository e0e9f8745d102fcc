#include "pipeline/escalation.hpp"

#include <spdlog/spdlog.h>

#include "gateway/resolver.hpp"
#include "pipeline/text.hpp"
#include "pipeline/tool_actions.hpp"

namespace swarm::pipeline {

EscalationDecision EscalationStage::run(const TicketRequest &ticket, const TriageResult &triage) const {
  std::string lowered = to_lower(ticket.message);

  EscalationDecision decision;
  if (contains_any(lowered, {"security", "breach"})) {
    decision.route_to = RouteTarget::SecuritySpecialist;
    decision.reason = "Security indicators found in ticket.";
  } else if (contains_any(lowered, {"billing", "invoice", "refund"}) &&
             (triage.urgency == Urgency::High || triage.urgency == Urgency::Critical)) {
    decision.route_to = RouteTarget::BillingSpecialist;
    decision.reason = "High-priority billing issue needs specialist ownership.";
  } else if (triage.urgency == Urgency::Critical) {
    decision.route_to = RouteTarget::HumanSupportLead;
    decision.reason = "Critical severity requires immediate human oversight.";
  } else {
    decision.escalate = false;
    decision.route_to = RouteTarget::None;
    decision.reason = "Autonomous resolution path is acceptable.";
    return decision;
  }

  decision.escalate = true;
  decision.tool_actions = operationalize(ticket, decision.route_to);
  return decision;
}

std::vector<std::string> EscalationStage::operationalize(const TicketRequest &ticket, RouteTarget route) const {
  std::vector<std::string> actions;
  ToolActions tools(gateway_);
  if (!tools.available()) return actions;

  std::string route_name = to_string(route);

  if (auto ticket_tool = tools.resolve(gateway::KeywordToolResolver::ticket_update())) {
    auto output = tools.invoke(*ticket_tool, json{{"ticket_id", ticket.ticket_id}, {"status", "escalated"}, {"route_to", route_name}});
    if (output) {
      actions.push_back(ToolActions::action_record(*ticket_tool));
    }
  }

  if (auto notify_tool = tools.resolve(gateway::KeywordToolResolver::notification())) {
    auto output = tools.invoke(*notify_tool, json{{"to", notify_recipient_},
                                                  {"subject", "Escalation required for " + ticket.ticket_id},
                                                  {"body", "Ticket routed to " + route_name + ". Message: " + ticket.message}});
    if (output) {
      actions.push_back(ToolActions::action_record(*notify_tool));
    }
  }

  spdlog::debug("[Swarm] Escalation of {} to {} performed {} tool actions", ticket.ticket_id, route_name, actions.size());
  return actions;
}

}  // namespace swarm::pipeline
