#pragma once

#include <string>

#include "augment/augmenter.hpp"
#include "gateway/client.hpp"
#include "knowledge/store.hpp"
#include "pipeline/models.hpp"

namespace swarm::pipeline {

// Knowledge-store retrieval with a best-effort web lookup when local
// coverage is thin (fewer than kMinLocalNotes notes).
class ResearchStage {
 public:
  static constexpr int kDefaultLimit = 3;
  static constexpr std::size_t kMinLocalNotes = 2;
  static constexpr std::size_t kMaxToolNoteLength = 240;
  static constexpr std::size_t kMaxSynthesisLength = 500;

  static constexpr const char *kDefaultSynthesis = "Use internal runbooks and policies to resolve the issue.";

  ResearchStage(const knowledge::KnowledgeStore &store, const gateway::ToolGatewayClient &gateway, const augment::Augmenter &augmenter,
                int limit = kDefaultLimit)
      : store_(store), gateway_(gateway), augmenter_(augmenter), limit_(limit) {}

  ResearchResult run(const TicketRequest &ticket, const TriageResult &triage) const;

 private:
  const knowledge::KnowledgeStore &store_;
  const gateway::ToolGatewayClient &gateway_;
  const augment::Augmenter &augmenter_;
  int limit_;
};

}  // namespace swarm::pipeline
