#pragma once

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "knowledge/store.hpp"

namespace swarm::knowledge {

using json = nlohmann::json;

// Document submitted for ingestion
struct KnowledgeDocument {
  static constexpr std::size_t kMinContentLength = 20;

  std::string doc_id;
  std::string content;
  std::string source = "internal";

  // doc_id non-empty, content at least kMinContentLength characters
  static Result<KnowledgeDocument> from_json(const json &j);
};

// In-process store ranking documents by how many distinct query terms they
// contain. Terms are lower-cased alphanumeric runs. Documents sharing no term
// with the query are never returned; ties keep insertion order.
class MemoryKnowledgeStore : public KnowledgeStore {
 public:
  std::vector<KnowledgeHit> search(const std::string &query, int limit) const override;
  void add(const std::string &id, const std::string &content, const std::string &source) override;
  std::size_t size() const override;

  // Load the default support playbook when the store is empty
  void seed_default();

  // Import a JSON array of {"doc_id", "content", "source"}.
  // Returns the number of documents added, or the first validation error.
  Result<std::size_t> load_file(const std::filesystem::path &path);

 private:
  struct Entry {
    std::string id;
    std::string source;
    std::string content;
    std::vector<std::string> terms;  // Sorted, unique
  };

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

// Lower-cased alphanumeric runs, sorted and de-duplicated
std::vector<std::string> tokenize(const std::string &text);

constexpr std::size_t kPreviewLength = 140;

// Search hits as [{"doc_id": "result-N", "source", "content_preview"}].
// Previews hold at most kPreviewLength characters.
json search_results_json(const std::vector<KnowledgeHit> &hits);

}  // namespace swarm::knowledge
