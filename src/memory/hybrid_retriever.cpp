#include "hybrid_retriever.hpp"
#include "entry_json.hpp"
#include "../config.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <unordered_set>
#include <utility>

namespace hybridmem {

std::string kind_to_string(ItemKind kind) {
    switch (kind) {
        case ItemKind::Episodic: return "episodic";
        case ItemKind::Semantic: return "semantic";
    }
    return "episodic";
}

static std::string provenance_of(const nlohmann::json& extra) {
    if (!extra.is_object()) return {};
    auto it = extra.find("provenance");
    if (it != extra.end() && it->is_string()) return it->get<std::string>();
    return {};
}

static RetrievedItem from_event(Event event) {
    RetrievedItem item;
    item.kind = ItemKind::Episodic;
    item.id = event.id;
    item.text = event.text;
    item.source = provenance_of(event.extra);
    if (item.source.empty()) {
        item.source = "episodic@" + format_iso8601(event.timestamp) + "#" + event.type;
    }
    item.event = std::move(event);
    return item;
}

static RetrievedItem from_document(Document doc) {
    RetrievedItem item;
    item.kind = ItemKind::Semantic;
    item.id = doc.id;
    item.text = doc.text;
    item.score = doc.score;
    item.source = provenance_of(doc.extra);
    if (item.source.empty()) {
        std::string anchor = doc.metadata.section;
        if (anchor.empty()) {
            auto md_id = metadata_field(doc.metadata, "id");
            anchor = md_id.is_string() ? md_id.get<std::string>() : doc.id;
        }
        item.source = doc.metadata.source + "#" + anchor;
    }
    item.document = std::move(doc);
    return item;
}

nlohmann::json item_to_json(const RetrievedItem& item) {
    nlohmann::json j;
    if (item.event) {
        j = event_to_json(*item.event);
    } else if (item.document) {
        j = document_to_json(*item.document);
    } else {
        j = {{"id", item.id}, {"text", item.text}};
    }
    j["kind"] = kind_to_string(item.kind);
    j["source"] = item.source;
    j["score"] = item.score;
    return j;
}

std::string item_identifier(const RetrievedItem& item) {
    if (!item.id.empty()) return item.id;
    if (!item.source.empty()) return item.source;
    if (item.event) return provenance_of(item.event->extra);
    if (item.document) return provenance_of(item.document->extra);
    return {};
}

RetrieverOptions RetrieverOptions::from_config(const MemoryConfig& cfg) {
    RetrieverOptions opts;
    opts.k_epi = cfg.k_epi;
    opts.k_sem = cfg.k_sem;
    opts.token_budget = cfg.token_budget;
    opts.reranker_enabled = cfg.reranker_enabled;
    opts.semantic_filter = cfg.sem_filters;
    if (cfg.epi_filters.is_object() && !cfg.epi_filters.empty()) {
        Filters filters = cfg.epi_filters;
        opts.episodic_filter = [filters](const Event& e) {
            return event_matches(e, filters);
        };
    }
    return opts;
}

HybridRetriever::HybridRetriever(const EventLog& episodic, const VectorStore& semantic,
                                 RetrieverOptions options)
    : episodic_(episodic), semantic_(semantic), options_(std::move(options)) {}

std::vector<RetrievedItem> HybridRetriever::collect(const std::string& query) const {
    std::vector<RetrievedItem> items;

    for (auto& e : episodic_.topk(options_.k_epi, options_.episodic_filter)) {
        items.push_back(from_event(std::move(e)));
    }

    if (options_.k_sem == 0) return items;

    bool filtered = options_.semantic_filter.is_object() && !options_.semantic_filter.empty();
    auto docs = semantic_.search(query, options_.k_sem, options_.semantic_filter);
    if (docs.empty() && filtered && !semantic_.empty()) {
        std::cerr << "[retriever] Semantic filter matched nothing, retrying unfiltered\n";
        docs = semantic_.search(query, options_.k_sem);
    }
    for (auto& d : docs) {
        items.push_back(from_document(std::move(d)));
    }
    return items;
}

std::vector<RetrievedItem> HybridRetriever::retrieve(const std::string& query) const {
    auto items = collect(query);
    if (options_.reranker_enabled) rerank(items, query);
    dedupe(items);
    trim_to_budget(items, options_.token_budget);
    return items;
}

void rerank(std::vector<RetrievedItem>& items, const std::string& query) {
    auto query_words = split_words(to_lower(query));
    std::unordered_set<std::string> q(query_words.begin(), query_words.end());

    for (auto& item : items) {
        auto words = split_words(to_lower(item.text));
        std::unordered_set<std::string> w(words.begin(), words.end());
        size_t overlap = 0;
        for (const auto& word : w) {
            if (q.count(word)) overlap++;
        }

        double score = item.kind == ItemKind::Semantic ? 1.0 : 0.05;
        score += 0.1 * static_cast<double>(overlap);
        item.score = score;
    }

    std::stable_sort(items.begin(), items.end(),
                     [](const RetrievedItem& a, const RetrievedItem& b) {
                         return a.score > b.score;
                     });
}

void dedupe(std::vector<RetrievedItem>& items) {
    std::set<std::pair<std::string, std::string>> seen;
    items.erase(std::remove_if(items.begin(), items.end(),
        [&seen](const RetrievedItem& item) {
            return !seen.emplace(item.source, item.text).second;
        }), items.end());
}

void trim_to_budget(std::vector<RetrievedItem>& items, uint32_t token_budget) {
    uint64_t used = 0;
    size_t keep = 0;
    for (; keep < items.size(); keep++) {
        uint64_t cost = estimate_tokens(items[keep].text);
        if (used + cost > token_budget) break;
        used += cost;
    }
    items.resize(keep);
}

} // namespace hybridmem
