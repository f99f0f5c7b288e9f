#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace hybridmem {

using Embedding = std::vector<float>;

struct Config; // forward declare

// Abstract embedding provider interface.
// Implementations must return identical vectors for identical text. The
// width may differ between calls; VectorStore reconciles it.
class Embedder {
public:
    virtual ~Embedder() = default;

    // Compute embedding vector for the given text
    virtual Embedding embed(const std::string& text) = 0;

    // Nominal dimensionality of the embedding vectors
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "hash")
    virtual std::string embedder_name() const = 0;
};

// Feature-hashing embedder: lower-cased alphanumeric tokens are hashed
// (FNV-1a) into `dimensions` buckets with a hash-derived sign.
class HashEmbedder : public Embedder {
public:
    explicit HashEmbedder(uint32_t dimensions = 256);

    Embedding embed(const std::string& text) override;
    uint32_t dimensions() const override { return dimensions_; }
    std::string embedder_name() const override { return "hash"; }

private:
    uint32_t dimensions_;
};

// Create an embedder from config. Returns nullptr if embeddings are disabled
// or the configured provider is not recognized.
std::unique_ptr<Embedder> create_embedder(const Config& config);

} // namespace hybridmem
