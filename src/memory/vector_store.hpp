#pragma once
#include "../embedder.hpp"
#include "filters.hpp"
#include "vector.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hybridmem {

struct DocumentMetadata {
    std::string source;
    std::string section;
    std::vector<std::string> tags;
    bool pii = false;
    nlohmann::json extra = nlohmann::json::object(); // other metadata fields
};

struct Document {
    std::string id;
    std::string text;
    DocumentMetadata metadata;
    Embedding embedding;   // unit-normalized, filled on documents handed out by the store
    double score = 0.0;    // similarity, set by search()
    nlohmann::json extra = nlohmann::json::object(); // caller-defined fields
};

// Metadata field value by name for filtering; null when absent.
nlohmann::json metadata_field(const DocumentMetadata& md, const std::string& key);

bool document_matches(const Document& doc, const Filters& filters);

// Semantic memory: documents with unit-normalized embeddings, searched by
// cosine similarity. Not thread-safe: callers serialize upsert against search.
class VectorStore {
public:
    // The embedder must be non-null and outlive the store.
    explicit VectorStore(Embedder* embedder, bool pii_scrub_at_ingest = false);

    // Insert or replace by id. Throws MissingText when text is empty.
    // Exceptions from the embedder propagate unchanged. Returns the document id.
    std::string upsert(Document doc);

    // Parse a JSON record ({id, text, metadata, ...}) and upsert it.
    std::string upsert(const nlohmann::json& record);

    // Top `top_k` documents by cosine similarity, optionally restricted to
    // those matching `filters`. Ties keep insertion order. Empty if nothing matches.
    std::vector<Document> search(const std::string& query, size_t top_k,
                                 const Filters& filters = nullptr) const;

    std::optional<Document> get(const std::string& id) const;

    size_t size() const { return docs_.size(); }
    bool empty() const { return docs_.empty(); }

    // Current embedding width of the matrix
    size_t dimensions() const { return matrix_.cols(); }

    bool pii_scrub_at_ingest() const { return pii_scrub_; }

private:
    Embedding encode(const std::string& text) const;
    std::string next_synthetic_id() const;
    Document with_embedding(size_t row) const;

    Embedder* embedder_;
    bool pii_scrub_;
    std::vector<Document> docs_;  // row i of matrix_ belongs to docs_[i]
    EmbeddingMatrix matrix_;
    std::unordered_map<std::string, size_t> id_index_; // id -> row
};

} // namespace hybridmem
