#include "event_log.hpp"
#include "entry_json.hpp"
#include "../config.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cstdint>

namespace hybridmem {

static constexpr uint64_t kSecondsPerDay = 86400;

static uint64_t saturating_add(uint64_t a, uint64_t b) {
    return a > UINT64_MAX - b ? UINT64_MAX : a + b;
}

static nlohmann::json string_or_null(const std::string& s) {
    if (s.empty()) return nullptr;
    return s;
}

nlohmann::json event_field(const Event& event, const std::string& key) {
    if (key == "id")                        return string_or_null(event.id);
    if (key == "task_id")                   return string_or_null(event.task_id);
    if (key == "session")                   return string_or_null(event.session);
    if (key == "type" || key == "category") return string_or_null(event.type);
    if (key == "text")                      return string_or_null(event.text);
    if (key == "timestamp" || key == "ts") {
        if (event.timestamp == 0) return nullptr;
        return event.timestamp;
    }
    if (key == "expires_at") {
        if (event.expires_at == 0) return nullptr;
        return event.expires_at;
    }
    if (key == "tags") return event.tags;

    if (event.extra.is_object()) {
        auto it = event.extra.find(key);
        if (it != event.extra.end()) return *it;
    }
    return nullptr;
}

bool event_matches(const Event& event, const Filters& filters) {
    return matches_filters(filters,
        [&event](const std::string& key) { return event_field(event, key); },
        event.tags);
}

std::optional<uint32_t> TtlPolicy::days_for(const std::string& category) const {
    auto it = by_category.find(category);
    if (it != by_category.end()) return it->second;
    return default_days;
}

TtlPolicy TtlPolicy::from_config(const MemoryConfig& cfg) {
    TtlPolicy policy;
    policy.default_days = cfg.episodic_ttl_days;
    policy.by_category = cfg.ttl_days;
    return policy;
}

EventLog::EventLog(size_t capacity, TtlPolicy ttl)
    : events_(capacity), ttl_(std::move(ttl)) {}

bool EventLog::expired(const Event& e, uint64_t now) {
    return e.expires_at != 0 && e.expires_at <= now;
}

Event EventLog::log(Event event) {
    if (event.timestamp == 0) event.timestamp = epoch_seconds();
    if (event.expires_at == 0) {
        auto days = ttl_.days_for(event.type);
        if (days) event.expires_at = saturating_add(event.timestamp, *days * kSecondsPerDay);
    }

    Event stored = event;
    if (events_.push_back(std::move(event))) evicted_++;
    return stored;
}

Event EventLog::log(const nlohmann::json& record) {
    return log(event_from_json(record, epoch_seconds()));
}

size_t EventLog::purge_expired() {
    uint64_t now = epoch_seconds();
    return events_.remove_if([now](const Event& e) { return expired(e, now); });
}

std::vector<Event> EventLog::fetch(const EventQuery& query) {
    purge_expired();

    uint64_t now = epoch_seconds();
    uint64_t cutoff = 0;
    if (query.since_minutes) {
        uint64_t window = static_cast<uint64_t>(*query.since_minutes) * 60;
        cutoff = window < now ? now - window : 0;
    }

    std::vector<Event> result;
    for (size_t i = 0; i < events_.size(); i++) {
        const Event& e = events_[i];
        if (query.task_id && e.task_id != *query.task_id) continue;
        if (!event_matches(e, query.filters)) continue;
        if (query.since_minutes && e.timestamp < cutoff) continue;
        result.push_back(e);
    }

    if (query.last_n && result.size() > *query.last_n) {
        result.erase(result.begin(),
                     result.end() - static_cast<ptrdiff_t>(*query.last_n));
    }
    return result;
}

std::vector<Event> EventLog::topk(size_t k, const EventPredicate& pred) const {
    uint64_t now = epoch_seconds();

    // Walk newest to oldest so only the last k matches are collected
    std::vector<Event> result;
    for (size_t i = events_.size(); i > 0 && result.size() < k; i--) {
        const Event& e = events_[i - 1];
        if (expired(e, now)) continue;
        if (pred && !pred(e)) continue;
        result.push_back(e);
    }
    std::reverse(result.begin(), result.end());
    return result;
}

std::vector<Event> EventLog::snapshot() const {
    std::vector<Event> result;
    result.reserve(events_.size());
    for (size_t i = 0; i < events_.size(); i++) {
        result.push_back(events_[i]);
    }
    return result;
}

} // namespace hybridmem
