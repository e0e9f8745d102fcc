#pragma once

#include <string>
#include <vector>

#include "augment/augmenter.hpp"
#include "pipeline/models.hpp"

namespace swarm::pipeline {

// One row of the ordered classification table
struct TriageTier {
  std::vector<std::string> terms;
  Urgency urgency;
  double confidence;
  std::string reason;
};

// Keyword tiers evaluated top-down, first match wins. The last tier has no
// terms and always matches.
const std::vector<TriageTier> &triage_tiers();

// Deterministic urgency classification of message + urgency hint.
// Augmentation can only append a note to the reason.
class TriageStage {
 public:
  static constexpr std::size_t kMaxNoteLength = 160;

  explicit TriageStage(const augment::Augmenter &augmenter) : augmenter_(augmenter) {}

  TriageResult run(const TicketRequest &ticket) const;

 private:
  const augment::Augmenter &augmenter_;
};

}  // namespace swarm::pipeline
