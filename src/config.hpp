#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace hybridmem {

struct EmbeddingConfig {
    std::string provider = "hash";  // "hash" or "none"
    uint32_t dimensions = 256;
};

struct MemoryConfig {
    uint32_t event_capacity = 2000;
    uint32_t k_epi = 4;
    uint32_t k_sem = 3;
    uint32_t token_budget = 1600;
    uint32_t episodic_ttl_days = 30;
    // category -> days; nullopt = never expires
    std::unordered_map<std::string, std::optional<uint32_t>> ttl_days;
    nlohmann::json epi_filters = nullptr;
    nlohmann::json sem_filters = {{"tags", nlohmann::json::array({"policy"})}, {"pii", false}};
    bool reranker_enabled = false;
    bool pii_scrub_at_ingest = false;
};

struct Config {
    MemoryConfig memory;
    EmbeddingConfig embeddings;

    // Load from ~/.hybridmem/config.json (or $HM_CONFIG) + HM_* env vars
    static Config load();

    // Parse an already-loaded config document. Missing keys keep defaults.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply HM_* environment variable overrides
    void apply_env_overrides();
};

} // namespace hybridmem
