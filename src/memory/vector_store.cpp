#include "vector_store.hpp"
#include "entry_json.hpp"
#include "errors.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace hybridmem {

nlohmann::json metadata_field(const DocumentMetadata& md, const std::string& key) {
    if (key == "source")  return md.source.empty() ? nlohmann::json(nullptr) : nlohmann::json(md.source);
    if (key == "section") return md.section.empty() ? nlohmann::json(nullptr) : nlohmann::json(md.section);
    if (key == "pii")     return md.pii;
    if (key == "tags")    return md.tags;

    if (md.extra.is_object()) {
        auto it = md.extra.find(key);
        if (it != md.extra.end()) return *it;
    }
    return nullptr;
}

bool document_matches(const Document& doc, const Filters& filters) {
    return matches_filters(filters,
        [&doc](const std::string& key) { return metadata_field(doc.metadata, key); },
        doc.metadata.tags);
}

VectorStore::VectorStore(Embedder* embedder, bool pii_scrub_at_ingest)
    : embedder_(embedder), pii_scrub_(pii_scrub_at_ingest) {
    if (!embedder_) {
        throw std::invalid_argument("VectorStore requires an embedder");
    }
}

Embedding VectorStore::encode(const std::string& text) const {
    return l2_normalize(embedder_->embed(text));
}

std::string VectorStore::next_synthetic_id() const {
    std::string base = std::to_string(docs_.size());
    std::string id = base;
    // A caller may already have used the row number as an explicit id
    for (size_t n = 1; id_index_.count(id); n++) {
        id = base + "_" + std::to_string(n);
    }
    return id;
}

std::string VectorStore::upsert(Document doc) {
    if (doc.text.empty()) {
        throw MissingText("document '" + doc.id + "' has no text");
    }
    if (pii_scrub_) doc.text = redact_emails(doc.text);

    Embedding vec = encode(doc.text);
    size_t old_width = matrix_.cols();
    if (!matrix_.empty() && vec.size() != old_width) {
        std::cerr << "[vector_store] Embedding width " << vec.size()
                  << " differs from stored width " << old_width
                  << ", zero-padding the narrower side\n";
    }

    doc.embedding.clear();
    doc.score = 0.0;

    auto it = doc.id.empty() ? id_index_.end() : id_index_.find(doc.id);
    if (it != id_index_.end()) {
        size_t row = it->second;
        matrix_.set_row(row, vec);
        docs_[row] = std::move(doc);
        return docs_[row].id;
    }

    if (doc.id.empty()) doc.id = next_synthetic_id();
    size_t row = matrix_.append_row(vec);
    id_index_[doc.id] = row;
    docs_.push_back(std::move(doc));
    return docs_.back().id;
}

std::string VectorStore::upsert(const nlohmann::json& record) {
    return upsert(document_from_json(record));
}

Document VectorStore::with_embedding(size_t row) const {
    Document doc = docs_[row];
    doc.embedding = matrix_.row(row);
    return doc;
}

std::vector<Document> VectorStore::search(const std::string& query, size_t top_k,
                                          const Filters& filters) const {
    if (docs_.empty()) return {};

    Embedding q = encode(query);

    std::vector<size_t> candidates;
    candidates.reserve(docs_.size());
    for (size_t i = 0; i < docs_.size(); i++) {
        if (document_matches(docs_[i], filters)) candidates.push_back(i);
    }
    if (candidates.empty()) return {};

    // A query narrower or wider than the matrix is compared over the common
    // prefix, which equals zero-padding the narrower side.
    std::vector<std::pair<double, size_t>> scored;
    scored.reserve(candidates.size());
    for (size_t row : candidates) {
        double sim = dot_product(q.data(), q.size(), matrix_.row_data(row), matrix_.cols());
        scored.emplace_back(sim, row);
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    size_t k = std::min(top_k, scored.size());
    std::vector<Document> result;
    result.reserve(k);
    for (size_t i = 0; i < k; i++) {
        Document doc = with_embedding(scored[i].second);
        doc.score = scored[i].first;
        result.push_back(std::move(doc));
    }
    return result;
}

std::optional<Document> VectorStore::get(const std::string& id) const {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) return std::nullopt;
    return with_embedding(it->second);
}

} // namespace hybridmem
