#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace hybridmem {

nlohmann::json Config::defaults_json() {
    return {
        {"memory", {
            {"event_capacity", 2000},
            {"k_epi", 4},
            {"k_sem", 3},
            {"token_budget", 1600},
            {"episodic_ttl_days", 30},
            {"ttl_days", nlohmann::json::object()},
            {"epi_filters", nullptr},
            {"sem_filters", {{"tags", nlohmann::json::array({"policy"})}, {"pii", false}}},
            {"reranker_enabled", false},
            {"pii_scrub_at_ingest", false}
        }},
        {"embeddings", {
            {"provider", "hash"},
            {"dimensions", 256}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Non-negative integer that fits in uint32_t; other types are ignored
static bool read_uint(const nlohmann::json& obj, const char* key, uint32_t& target) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer()) return false;
    auto value = it->get<int64_t>();
    if (value < 0 || value > static_cast<int64_t>(UINT32_MAX)) return false;
    target = static_cast<uint32_t>(value);
    return true;
}

static void read_bool(const nlohmann::json& obj, const char* key, bool& target) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_boolean()) target = it->get<bool>();
}

static void read_filters(const nlohmann::json& obj, const char* key, nlohmann::json& target) {
    auto it = obj.find(key);
    if (it != obj.end() && (it->is_object() || it->is_null())) target = *it;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        uint32_t capacity = 0;
        if (read_uint(m, "event_capacity", capacity) && capacity > 0)
            cfg.memory.event_capacity = capacity;
        read_uint(m, "k_epi", cfg.memory.k_epi);
        read_uint(m, "k_sem", cfg.memory.k_sem);
        read_uint(m, "token_budget", cfg.memory.token_budget);
        read_uint(m, "episodic_ttl_days", cfg.memory.episodic_ttl_days);
        if (m.contains("ttl_days") && m["ttl_days"].is_object()) {
            for (auto& [category, days] : m["ttl_days"].items()) {
                if (days.is_null()) {
                    cfg.memory.ttl_days[category] = std::nullopt;
                } else if (days.is_number_integer() && days.get<int64_t>() >= 0 &&
                           days.get<int64_t>() <= static_cast<int64_t>(UINT32_MAX)) {
                    cfg.memory.ttl_days[category] = static_cast<uint32_t>(days.get<int64_t>());
                }
            }
        }
        read_filters(m, "epi_filters", cfg.memory.epi_filters);
        read_filters(m, "sem_filters", cfg.memory.sem_filters);
        read_bool(m, "reranker_enabled", cfg.memory.reranker_enabled);
        read_bool(m, "pii_scrub_at_ingest", cfg.memory.pii_scrub_at_ingest);
    }

    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        auto& e = j["embeddings"];
        if (e.contains("provider") && e["provider"].is_string())
            cfg.embeddings.provider = e["provider"].get<std::string>();
        read_uint(e, "dimensions", cfg.embeddings.dimensions);
    }

    return cfg;
}

static void override_uint(const char* name, uint32_t& target, bool allow_zero = true) {
    const char* v = std::getenv(name);
    if (!v) return;
    try {
        size_t pos = 0;
        std::string s = trim(v);
        long long parsed = std::stoll(s, &pos);
        if (pos != s.size() || parsed < 0 || parsed > UINT32_MAX) return;
        if (!allow_zero && parsed == 0) return;
        target = static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring non-numeric " << name << "=" << v << "\n";
    }
}

static void override_json_object(const char* name, nlohmann::json& target) {
    const char* v = std::getenv(name);
    if (!v || !*v) return;
    auto parsed = nlohmann::json::parse(v, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        std::cerr << "[config] Ignoring invalid JSON object in " << name << "\n";
        return;
    }
    target = std::move(parsed);
}

void Config::apply_env_overrides() {
    override_uint("HM_K_EPI", memory.k_epi);
    override_uint("HM_K_SEM", memory.k_sem);
    override_uint("HM_TOKEN_BUDGET", memory.token_budget);
    override_uint("HM_EPISODIC_TTL_DAYS", memory.episodic_ttl_days);
    override_uint("HM_EVENT_CAPACITY", memory.event_capacity, false);
    override_json_object("HM_EPI_FILTERS_JSON", memory.epi_filters);
    override_json_object("HM_SEM_FILTERS_JSON", memory.sem_filters);
    if (const char* v = std::getenv("HM_RERANKER_ENABLED"))
        memory.reranker_enabled = parse_flag(v);
    if (const char* v = std::getenv("HM_PII_SCRUB"))
        memory.pii_scrub_at_ingest = parse_flag(v);
}

Config Config::load() {
    std::string config_path = expand_home("~/.hybridmem/config.json");
    if (const char* v = std::getenv("HM_CONFIG")) {
        if (*v) config_path = expand_home(v);
    }

    nlohmann::json j = defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            // Malformed config file: fall back to defaults
            std::cerr << "[config] Failed to parse " << config_path << ": " << e.what()
                      << ", using defaults\n";
            j = defaults_json();
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    cfg.apply_env_overrides();
    return cfg;
}

} // namespace hybridmem
