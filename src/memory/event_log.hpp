#pragma once
#include "filters.hpp"
#include "ring_buffer.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hybridmem {

struct MemoryConfig; // forward declaration

// One interaction step. Timestamps are epoch seconds; 0 means "unset"
// (for expires_at after logging, it means "never expires"). An instant of
// exactly 1970-01-01T00:00:00Z is therefore not representable: log()
// replaces a zero timestamp with the current time.
struct Event {
    std::string id;
    std::string task_id;
    std::string session;
    std::string type;
    std::string text;
    uint64_t timestamp = 0;
    uint64_t expires_at = 0;
    std::vector<std::string> tags;
    nlohmann::json extra = nlohmann::json::object(); // caller-defined fields
};

// Field value by name for filtering: known fields first, then the
// extension bag. Empty strings and unset timestamps read as null.
nlohmann::json event_field(const Event& event, const std::string& key);

// Equality/tag filter semantics shared by fetch() and config-driven predicates.
bool event_matches(const Event& event, const Filters& filters);

using EventPredicate = std::function<bool(const Event&)>;

// Per-category time-to-live in days. A category mapped to nullopt never expires.
struct TtlPolicy {
    uint32_t default_days = 30;
    std::unordered_map<std::string, std::optional<uint32_t>> by_category;

    std::optional<uint32_t> days_for(const std::string& category) const;

    static TtlPolicy from_config(const MemoryConfig& cfg);
};

struct EventQuery {
    std::optional<std::string> task_id;
    std::optional<size_t> last_n;
    std::optional<uint32_t> since_minutes;
    Filters filters; // null = no filtering
};

// Capacity-bounded, time-ordered episodic log.
// Not thread-safe: callers serialize writes against reads.
class EventLog {
public:
    explicit EventLog(size_t capacity = 2000, TtlPolicy ttl = {});

    // Append an event, assigning timestamp and expires_at when unset.
    // Evicts the oldest event once capacity is exceeded. Returns the stored event.
    Event log(Event event);

    // Parse a JSON record and log it. Throws InvalidEvent if the record
    // is not an object or a known field has the wrong type.
    Event log(const nlohmann::json& record);

    // Purge expired events, then filter by task, filters and age, then keep
    // the last `last_n` survivors in order.
    std::vector<Event> fetch(const EventQuery& query = {});

    // Last k events accepted by pred, in log order. Expired events are
    // skipped but not purged.
    std::vector<Event> topk(size_t k, const EventPredicate& pred = nullptr) const;

    // Remove every event whose expires_at is at or before now. Returns count removed.
    size_t purge_expired();

    // All stored events, oldest first, without purging.
    std::vector<Event> snapshot() const;

    std::optional<uint32_t> ttl_days(const std::string& category) const {
        return ttl_.days_for(category);
    }

    size_t size() const { return events_.size(); }
    size_t capacity() const { return events_.capacity(); }
    bool empty() const { return events_.empty(); }
    uint64_t evicted_count() const { return evicted_; }

private:
    static bool expired(const Event& e, uint64_t now);

    RingBuffer<Event> events_;
    TtlPolicy ttl_;
    uint64_t evicted_ = 0;
};

} // namespace hybridmem
