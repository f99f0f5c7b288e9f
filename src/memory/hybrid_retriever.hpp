#pragma once
#include "event_log.hpp"
#include "vector_store.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hybridmem {

struct MemoryConfig; // forward declaration

enum class ItemKind { Episodic, Semantic };

std::string kind_to_string(ItemKind kind);

// One merged retrieval result. Exactly one of event/document is set,
// matching `kind`.
struct RetrievedItem {
    ItemKind kind = ItemKind::Episodic;
    std::string source;  // provenance
    std::string id;
    std::string text;
    double score = 0.0;
    std::optional<Event> event;
    std::optional<Document> document;
};

// Union of the original record's fields plus kind, source and score.
nlohmann::json item_to_json(const RetrievedItem& item);

// Identifier a tracing sink records for the item: id, else source,
// else the provenance field.
std::string item_identifier(const RetrievedItem& item);

struct RetrieverOptions {
    uint32_t k_epi = 4;
    uint32_t k_sem = 3;
    EventPredicate episodic_filter;  // empty = accept all
    uint32_t token_budget = 1600;
    bool reranker_enabled = false;
    Filters semantic_filter;         // null = unfiltered

    static RetrieverOptions from_config(const MemoryConfig& cfg);
};

// Merges the recent episodic window with similarity-ranked semantic
// documents, then reranks (optional), deduplicates and trims to the token
// budget. Borrows both stores; they must outlive the retriever.
class HybridRetriever {
public:
    HybridRetriever(const EventLog& episodic, const VectorStore& semantic,
                    RetrieverOptions options = {});

    std::vector<RetrievedItem> retrieve(const std::string& query) const;

    const RetrieverOptions& options() const { return options_; }

private:
    std::vector<RetrievedItem> collect(const std::string& query) const;

    const EventLog& episodic_;
    const VectorStore& semantic_;
    RetrieverOptions options_;
};

// Pipeline stages, exposed for callers that assemble their own pool.

// Score: +1.0 semantic, +0.05 episodic, +0.1 per distinct lower-cased word
// shared with the query. Stable-sorts by descending score.
void rerank(std::vector<RetrievedItem>& items, const std::string& query);

// Keep the first occurrence of each (source, text) pair.
void dedupe(std::vector<RetrievedItem>& items);

// Keep the longest prefix whose estimated token cost fits the budget.
void trim_to_budget(std::vector<RetrievedItem>& items, uint32_t token_budget);

} // namespace hybridmem
