#include "embedder.hpp"
#include "config.hpp"
#include "util.hpp"
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace hybridmem {

static uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

HashEmbedder::HashEmbedder(uint32_t dimensions) : dimensions_(dimensions) {
    if (dimensions_ == 0) {
        throw std::invalid_argument("HashEmbedder requires at least one dimension");
    }
}

Embedding HashEmbedder::embed(const std::string& text) {
    Embedding emb(dimensions_, 0.0f);

    std::string lower = to_lower(text);
    std::string token;
    auto flush = [&]() {
        if (token.empty()) return;
        uint64_t h = fnv1a(token);
        size_t bucket = static_cast<size_t>(h % dimensions_);
        emb[bucket] += ((h >> 63) & 1) ? -1.0f : 1.0f;
        token.clear();
    };
    for (char c : lower) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            token += c;
        } else {
            flush();
        }
    }
    flush();
    return emb;
}

std::unique_ptr<Embedder> create_embedder(const Config& config) {
    const auto& emb = config.embeddings;

    if (emb.provider.empty() || emb.provider == "none") return nullptr;

    if (emb.provider == "hash") {
        if (emb.dimensions == 0) {
            std::cerr << "[embedder] Hash embeddings configured with 0 dimensions\n";
            return nullptr;
        }
        return std::make_unique<HashEmbedder>(emb.dimensions);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << emb.provider << "\n";
    return nullptr;
}

} // namespace hybridmem
