#include "knowledge/memory_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

#include "core/utf8.hpp"

namespace swarm::knowledge {

namespace {

// Words too common to say anything about relevance
const std::set<std::string> &stop_words() {
  static const std::set<std::string> words = {"a",  "an", "and", "are", "as", "at", "be", "by", "do",  "for", "how", "i",   "in",
                                              "is", "it", "my", "of",  "on",  "or", "our", "the", "to", "we",  "with", "you", "your"};
  return words;
}

}  // namespace

std::vector<std::string> tokenize(const std::string &text) {
  std::vector<std::string> terms;
  std::string current;
  auto flush = [&]() {
    if (!current.empty() && stop_words().count(current) == 0) {
      terms.push_back(current);
    }
    current.clear();
  };

  for (unsigned char c : text) {
    if (std::isalnum(c)) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else {
      flush();
    }
  }
  flush();

  std::sort(terms.begin(), terms.end());
  terms.erase(std::unique(terms.begin(), terms.end()), terms.end());
  return terms;
}

// ============================================================
// KnowledgeDocument
// ============================================================

Result<KnowledgeDocument> KnowledgeDocument::from_json(const json &j) {
  if (!j.is_object()) {
    return Result<KnowledgeDocument>::failure("Knowledge document must be a JSON object.");
  }

  for (const char *key : {"doc_id", "content", "source"}) {
    if (j.contains(key) && !j[key].is_string()) {
      return Result<KnowledgeDocument>::failure("Field '" + std::string(key) + "' must be a string.");
    }
  }

  KnowledgeDocument doc;
  doc.doc_id = j.value("doc_id", "");
  doc.content = j.value("content", "");
  doc.source = j.value("source", doc.source);

  if (doc.doc_id.empty()) {
    return Result<KnowledgeDocument>::failure("Field 'doc_id' is required.");
  }
  if (utf8_length(doc.content) < kMinContentLength) {
    return Result<KnowledgeDocument>::failure("Document '" + doc.doc_id + "' content must be at least " +
                                              std::to_string(kMinContentLength) + " characters.");
  }
  return Result<KnowledgeDocument>::success(std::move(doc));
}

// ============================================================
// MemoryKnowledgeStore
// ============================================================

std::vector<KnowledgeHit> MemoryKnowledgeStore::search(const std::string &query, int limit) const {
  std::vector<KnowledgeHit> hits;
  if (limit <= 0) return hits;

  auto query_terms = tokenize(query);
  if (query_terms.empty()) return hits;

  std::lock_guard lock(mutex_);

  std::vector<std::pair<std::size_t, std::size_t>> scored;  // (score, index)
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    const auto &terms = entries_[i].terms;
    std::size_t score = 0;
    for (const auto &term : query_terms) {
      if (std::binary_search(terms.begin(), terms.end(), term)) {
        ++score;
      }
    }
    if (score > 0) {
      scored.emplace_back(score, i);
    }
  }

  std::stable_sort(scored.begin(), scored.end(), [](const auto &a, const auto &b) {
    return a.first > b.first;
  });

  for (const auto &[score, index] : scored) {
    if (hits.size() >= static_cast<std::size_t>(limit)) break;
    hits.push_back(KnowledgeHit{entries_[index].source, entries_[index].content});
  }
  return hits;
}

void MemoryKnowledgeStore::add(const std::string &id, const std::string &content, const std::string &source) {
  Entry entry{id, source, content, tokenize(content)};

  std::lock_guard lock(mutex_);
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &e) {
    return e.id == id;
  });
  if (it != entries_.end()) {
    *it = std::move(entry);
  } else {
    entries_.push_back(std::move(entry));
  }
}

std::size_t MemoryKnowledgeStore::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

void MemoryKnowledgeStore::seed_default() {
  if (size() > 0) return;

  add("kb-1", "Password reset issues are usually solved by clearing SSO cache and retrying after 5 minutes.", "playbook");
  add("kb-2", "Billing disputes above 5000 USD must be routed to billing_specialist with invoice references.", "billing-policy");
  add("kb-3", "If a customer reports suspected account breach, escalate to security_specialist immediately.", "security-runbook");
  add("kb-4", "Enterprise support SLA: critical tickets target 15 minutes, high 60 minutes, medium 240, low 1440.", "sla-policy");

  spdlog::debug("[Knowledge] Seeded {} default documents", size());
}

Result<std::size_t> MemoryKnowledgeStore::load_file(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<std::size_t>::failure("Failed to open knowledge file: " + path.string());
  }

  json j = json::parse(file, nullptr, false);
  if (j.is_discarded() || !j.is_array()) {
    return Result<std::size_t>::failure("Knowledge file must contain a JSON array: " + path.string());
  }

  // Validate everything before touching the store
  std::vector<KnowledgeDocument> docs;
  for (const auto &item : j) {
    auto doc = KnowledgeDocument::from_json(item);
    if (!doc.ok()) {
      return Result<std::size_t>::failure(path.string() + ": " + doc.error.value_or("invalid document"));
    }
    docs.push_back(std::move(*doc.value));
  }

  for (const auto &doc : docs) {
    add(doc.doc_id, doc.content, doc.source);
  }
  spdlog::info("[Knowledge] Loaded {} documents from {}", docs.size(), path.string());
  return Result<std::size_t>::success(docs.size());
}

json search_results_json(const std::vector<KnowledgeHit> &hits) {
  json out = json::array();
  for (std::size_t i = 0; i < hits.size(); ++i) {
    out.push_back({{"doc_id", "result-" + std::to_string(i + 1)},
                   {"source", hits[i].source},
                   {"content_preview", truncate_utf8(hits[i].content, kPreviewLength)}});
  }
  return out;
}

}  // namespace swarm::knowledge
