#include "pipeline/research.hpp"

#include <spdlog/spdlog.h>

#include "gateway/resolver.hpp"
#include "pipeline/text.hpp"
#include "pipeline/tool_actions.hpp"

namespace swarm::pipeline {

namespace {

// "[source] text" -> "text"
std::string note_body(const std::string &note) {
  auto pos = note.find("] ");
  return pos == std::string::npos ? note : note.substr(pos + 2);
}

std::string join(const std::vector<std::string> &items, const std::string &sep) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) out += sep;
    out += item;
  }
  return out;
}

}  // namespace

ResearchResult ResearchStage::run(const TicketRequest &ticket, const TriageResult &triage) const {
  ResearchResult result;

  std::vector<knowledge::KnowledgeHit> hits;
  try {
    hits = store_.search(ticket.message, limit_);
  } catch (const std::exception &e) {
    spdlog::warn("[Swarm] Knowledge search failed for ticket {}: {}", ticket.ticket_id, e.what());
  }
  for (const auto &hit : hits) {
    result.retrieved_notes.push_back("[" + hit.source + "] " + hit.content);
  }

  result.web_lookup_needed = result.retrieved_notes.size() < kMinLocalNotes;

  ToolActions tools(gateway_);
  if (result.web_lookup_needed && tools.available()) {
    if (auto web_tool = tools.resolve(gateway::KeywordToolResolver::web_research())) {
      auto output = tools.invoke(*web_tool, json{{"query", ticket.message}, {"ticket_id", ticket.ticket_id}});
      if (output) {
        result.tool_actions.push_back(ToolActions::action_record(*web_tool));
        result.retrieved_notes.push_back("[tool:" + *web_tool + "] " + truncate_utf8(output->dump(), kMaxToolNoteLength));
      }
    }
  }

  std::string prompt = "Summarize the top support guidance in 2 sentences. Ticket: " + ticket.message +
                       "\nUrgency: " + to_string(triage.urgency) + "\nKnowledge: " + join(result.retrieved_notes, " | ");
  auto refined = augment::try_augment(
      augmenter_, "Research Agent",
      "You research support issues using internal KB first, and flag when external web validation is needed.", prompt);

  if (refined) {
    result.synthesis = truncate_utf8(*refined, kMaxSynthesisLength);
  } else if (!result.retrieved_notes.empty()) {
    std::vector<std::string> bodies;
    for (std::size_t i = 0; i < result.retrieved_notes.size() && i < 2; ++i) {
      bodies.push_back(note_body(result.retrieved_notes[i]));
    }
    result.synthesis = join(bodies, " ");
  } else {
    result.synthesis = kDefaultSynthesis;
  }
  return result;
}

}  // namespace swarm::pipeline
