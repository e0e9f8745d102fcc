#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace swarm::knowledge {

struct KnowledgeHit {
  std::string source;
  std::string content;
};

// Ranked text retrieval used by the research stage.
// search() must be safe to call concurrently with other searches.
class KnowledgeStore {
 public:
  virtual ~KnowledgeStore() = default;

  // Up to `limit` hits, best first
  virtual std::vector<KnowledgeHit> search(const std::string &query, int limit) const = 0;

  // Insert or replace a document
  virtual void add(const std::string &id, const std::string &content, const std::string &source) = 0;

  virtual std::size_t size() const = 0;
};

}  // namespace swarm::knowledge
