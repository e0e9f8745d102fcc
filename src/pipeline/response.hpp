#pragma once

#include <string>
#include <vector>

#include "augment/augmenter.hpp"
#include "pipeline/models.hpp"

namespace swarm::pipeline {

// Style descriptor handed to augmentation for a tone preference
std::string tone_style(Tone tone);

// Fixed follow-up list attached to every draft
const std::vector<std::string> &default_suggested_actions();

// Customer-facing draft: deterministic subject, augmented or templated body
class ResponseStage {
 public:
  static constexpr std::size_t kMaxMessageLength = 1000;

  explicit ResponseStage(const augment::Augmenter &augmenter) : augmenter_(augmenter) {}

  ResponseDraft run(const TicketRequest &ticket, const TriageResult &triage, const ResearchResult &research) const;

 private:
  const augment::Augmenter &augmenter_;
};

}  // namespace swarm::pipeline
