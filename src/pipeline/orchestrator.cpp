#include "pipeline/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <future>

#include "core/uuid.hpp"
#include "pipeline/text.hpp"

namespace swarm::pipeline {

Orchestrator::Orchestrator(const knowledge::KnowledgeStore &store, const gateway::ToolGatewayClient &gateway,
                           const augment::Augmenter &augmenter, OrchestratorOptions options)
    : augmenter_(augmenter),
      options_(std::move(options)),
      triage_(augmenter),
      research_(store, gateway, augmenter, options_.research_limit),
      response_(augmenter),
      escalation_(gateway, options_.notify_recipient) {}

SwarmRunResult Orchestrator::run(const TicketRequest &ticket) const {
  const std::string trace_id = generate_uuid();
  spdlog::info("[Swarm] Starting run ticket={} trace_id={}", ticket.ticket_id, trace_id);

  auto handoff_summary = augment::try_augment(augmenter_, "Orchestrator",
                                              "Run triage, research, response and escalation over a support ticket and return "
                                              "concise operational guidance.",
                                              "Ticket ID: " + ticket.ticket_id + "\nCustomer: " + ticket.customer_name + " (" +
                                                  ticket.company + ")\nMessage: " + ticket.message);

  TriageResult triage = triage_.run(ticket);
  spdlog::debug("[Swarm] trace_id={} triage urgency={} sla={}m", trace_id, to_string(triage.urgency), triage.sla_target_minutes);

  std::future<EscalationDecision> escalation_task;
  if (options_.parallel_escalation) {
    escalation_task = std::async(std::launch::async, [this, &ticket, triage]() {
      return escalation_.run(ticket, triage);
    });
  }

  ResearchResult research = research_.run(ticket, triage);
  if (handoff_summary) {
    research.synthesis += "\n\nHandoff summary: " + truncate_utf8(*handoff_summary, kMaxHandoffSummaryLength);
  }
  spdlog::debug("[Swarm] trace_id={} research notes={} web_lookup_needed={}", trace_id, research.retrieved_notes.size(),
                research.web_lookup_needed);

  ResponseDraft response = response_.run(ticket, triage, research);

  EscalationDecision escalation = options_.parallel_escalation ? escalation_task.get() : escalation_.run(ticket, triage);
  spdlog::debug("[Swarm] trace_id={} escalation route={}", trace_id, to_string(escalation.route_to));

  SwarmRunResult result;
  result.ticket_id = ticket.ticket_id;
  result.triage = std::move(triage);
  result.research = std::move(research);
  result.response = std::move(response);
  result.escalation = std::move(escalation);
  result.generated_at = std::chrono::system_clock::now();
  result.orchestration = kOrchestrationMode;
  result.trace_id = trace_id;

  spdlog::info("[Swarm] Finished run ticket={} trace_id={} urgency={} escalate={}", result.ticket_id, trace_id,
               to_string(result.triage.urgency), result.escalation.escalate);
  return result;
}

}  // namespace swarm::pipeline
