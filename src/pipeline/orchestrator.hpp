#pragma once

#include <string>

#include "augment/augmenter.hpp"
#include "gateway/client.hpp"
#include "knowledge/store.hpp"
#include "pipeline/escalation.hpp"
#include "pipeline/models.hpp"
#include "pipeline/research.hpp"
#include "pipeline/response.hpp"
#include "pipeline/triage.hpp"

namespace swarm::pipeline {

constexpr const char *kOrchestrationMode = "Deterministic four-stage pipeline with optional augmentation";

struct OrchestratorOptions {
  int research_limit = ResearchStage::kDefaultLimit;
  std::string notify_recipient = EscalationStage::kDefaultNotifyRecipient;
  bool parallel_escalation = true;  // Escalation only needs ticket + triage
};

// Runs Triage -> Research -> Response, and Escalation, for one ticket.
//
// Collaborators are owned by the caller and must outlive the orchestrator.
// run() is const and keeps no per-run state in members, so one orchestrator
// can serve concurrent runs.
class Orchestrator {
 public:
  static constexpr std::size_t kMaxHandoffSummaryLength = 280;

  Orchestrator(const knowledge::KnowledgeStore &store, const gateway::ToolGatewayClient &gateway, const augment::Augmenter &augmenter,
               OrchestratorOptions options = {});

  SwarmRunResult run(const TicketRequest &ticket) const;

  const OrchestratorOptions &options() const {
    return options_;
  }

 private:
  const augment::Augmenter &augmenter_;
  OrchestratorOptions options_;

  TriageStage triage_;
  ResearchStage research_;
  ResponseStage response_;
  EscalationStage escalation_;
};

}  // namespace swarm::pipeline
