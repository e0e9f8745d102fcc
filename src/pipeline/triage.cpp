#include "pipeline/triage.hpp"

#include "pipeline/text.hpp"

namespace swarm::pipeline {

const std::vector<TriageTier> &triage_tiers() {
  static const std::vector<TriageTier> tiers = {
      {{"breach", "outage", "down", "incident", "security"}, Urgency::Critical, 0.90, "Possible service or security incident detected."},
      {{"urgent", "can't login", "cannot login", "blocked"}, Urgency::High, 0.82, "Customer blocked from key workflow."},
      {{"billing", "invoice", "refund"}, Urgency::Medium, 0.78, "Billing-related request with potential business impact."},
      {{}, Urgency::Low, 0.70, "General support request with no outage indicators."},
  };
  return tiers;
}

TriageResult TriageStage::run(const TicketRequest &ticket) const {
  std::string lowered = to_lower(ticket.message + " " + ticket.urgency_hint.value_or(""));

  const auto &tiers = triage_tiers();
  const TriageTier *match = &tiers.back();
  for (const auto &tier : tiers) {
    if (tier.terms.empty() || contains_any(lowered, tier.terms)) {
      match = &tier;
      break;
    }
  }

  TriageResult result;
  result.urgency = match->urgency;
  result.sla_target_minutes = sla_minutes(match->urgency);
  result.confidence = match->confidence;
  result.reason = match->reason;

  auto note = augment::try_augment(augmenter_, "Triage Agent", "You triage incoming enterprise support tickets by urgency.",
                                   "Classify urgency as low/medium/high/critical and return one-sentence reason. Ticket: " + ticket.message);
  if (note) {
    result.reason += " Model note: " + truncate_utf8(*note, kMaxNoteLength);
  }
  return result;
}

}  // namespace swarm::pipeline
