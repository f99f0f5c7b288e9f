#include "memory.hpp"
#include <stdexcept>
#include <utility>

namespace hybridmem {

static Embedder* require_embedder(const std::unique_ptr<Embedder>& embedder) {
    if (!embedder) {
        throw std::invalid_argument("memory engine requires an embedder");
    }
    return embedder.get();
}

MemoryEngine::MemoryEngine(const Config& config, std::unique_ptr<Embedder> embedder)
    : embedder_(std::move(embedder)),
      episodic_(config.memory.event_capacity, TtlPolicy::from_config(config.memory)),
      semantic_(require_embedder(embedder_), config.memory.pii_scrub_at_ingest),
      retriever_(episodic_, semantic_, RetrieverOptions::from_config(config.memory)) {}

std::unique_ptr<MemoryEngine> create_memory(const Config& config,
                                            std::unique_ptr<Embedder> embedder) {
    if (!embedder) embedder = create_embedder(config);
    return std::make_unique<MemoryEngine>(config, std::move(embedder));
}

} // namespace hybridmem
