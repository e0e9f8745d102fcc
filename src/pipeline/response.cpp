#include "pipeline/response.hpp"

#include <algorithm>
#include <cctype>

#include "pipeline/text.hpp"

namespace swarm::pipeline {

std::string tone_style(Tone tone) {
  switch (tone) {
    case Tone::Friendly:
      return "warm, empathetic, and human";
    case Tone::Formal:
      return "professional and concise";
    case Tone::Direct:
      return "clear and action-oriented";
  }
  return "warm, empathetic, and human";
}

const std::vector<std::string> &default_suggested_actions() {
  static const std::vector<std::string> actions = {
      "Acknowledge the issue and provide immediate next step.",
      "Share ETA based on the assigned SLA.",
      "Offer a fallback workaround if available.",
      "Draft internal runbook update notes from the resolution.",
  };
  return actions;
}

ResponseDraft ResponseStage::run(const TicketRequest &ticket, const TriageResult &triage, const ResearchResult &research) const {
  std::string urgency = to_string(triage.urgency);
  std::string urgency_upper = urgency;
  std::transform(urgency_upper.begin(), urgency_upper.end(), urgency_upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });

  ResponseDraft draft;
  draft.subject = "[" + urgency_upper + "] Update on ticket " + ticket.ticket_id;
  draft.suggested_actions = default_suggested_actions();

  std::string prompt = "Draft a short support reply for " + ticket.customer_name + " at " + ticket.company + ". Urgency=" + urgency +
                       ". Tone=" + tone_style(ticket.preferred_tone) + ". Research=" + research.synthesis;
  auto drafted = augment::try_augment(augmenter_, "Response Agent",
                                      "You craft personalized customer support messages with recommended actions and clear ownership.", prompt);

  if (drafted) {
    draft.message = truncate_utf8(*drafted, kMaxMessageLength);
    return draft;
  }

  draft.message = "Hi " + ticket.customer_name +
                  ",\n\n"
                  "Thanks for raising this with us. We have triaged your request and started investigation using our internal runbooks. "
                  "Current priority is **" +
                  urgency + "** with a target response window of " + std::to_string(triage.sla_target_minutes) +
                  " minutes.\n\n"
                  "What we know so far: " +
                  research.synthesis +
                  "\n\n"
                  "We'll share another update shortly with resolution steps.\n\n"
                  "Best,\nSupport Swarm";
  return draft;
}

}  // namespace swarm::pipeline
