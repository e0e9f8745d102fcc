#pragma once

#include <string>
#include <utility>
#include <vector>

#include "gateway/client.hpp"
#include "pipeline/models.hpp"

namespace swarm::pipeline {

// Routing decision tree, first match wins:
//   1. security/breach terms            -> security_specialist
//   2. billing terms and high/critical  -> billing_specialist
//   3. critical urgency                 -> human_support_lead
//   4. otherwise                        -> none (no escalation)
// Escalating branches also try to update the ticket record and notify leads
// through the gateway before returning.
class EscalationStage {
 public:
  static constexpr const char *kDefaultNotifyRecipient = "support-leads@company.com";

  explicit EscalationStage(const gateway::ToolGatewayClient &gateway, std::string notify_recipient = kDefaultNotifyRecipient)
      : gateway_(gateway), notify_recipient_(std::move(notify_recipient)) {}

  EscalationDecision run(const TicketRequest &ticket, const TriageResult &triage) const;

 private:
  // Best-effort ticket update and notification; returns the action log
  std::vector<std::string> operationalize(const TicketRequest &ticket, RouteTarget route) const;

  const gateway::ToolGatewayClient &gateway_;
  std::string notify_recipient_;
};

}  // namespace swarm::pipeline
