#pragma once
#include "config.hpp"
#include "embedder.hpp"
#include "memory/event_log.hpp"
#include "memory/hybrid_retriever.hpp"
#include "memory/vector_store.hpp"
#include <memory>

namespace hybridmem {

// Episodic log, semantic store and retriever wired together from one
// Config. The retriever borrows the two stores owned here, so the engine
// is neither copyable nor movable.
class MemoryEngine {
public:
    MemoryEngine(const Config& config, std::unique_ptr<Embedder> embedder);

    MemoryEngine(const MemoryEngine&) = delete;
    MemoryEngine& operator=(const MemoryEngine&) = delete;

    EventLog& episodic() { return episodic_; }
    VectorStore& semantic() { return semantic_; }
    const HybridRetriever& retriever() const { return retriever_; }

    std::vector<RetrievedItem> retrieve(const std::string& query) const {
        return retriever_.retrieve(query);
    }

private:
    std::unique_ptr<Embedder> embedder_;
    EventLog episodic_;
    VectorStore semantic_;
    HybridRetriever retriever_;
};

// Create a memory engine from config. When no embedder is injected one is
// built with create_embedder(); throws std::invalid_argument if that yields none.
std::unique_ptr<MemoryEngine> create_memory(const Config& config,
                                            std::unique_ptr<Embedder> embedder = nullptr);

} // namespace hybridmem
