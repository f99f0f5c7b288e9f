#pragma once
#include "event_log.hpp"
#include "vector_store.hpp"
#include "errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <cmath>

namespace hybridmem {

// Shared JSON <-> Event/Document conversion used by EventLog, VectorStore
// and retrieved-item rendering.

// Timestamps are epoch seconds or ISO 8601 strings. Anything unparsable,
// negative or past kMaxEpochSeconds falls back to `now`; an absent or null
// value stays 0 (unset).
inline uint64_t timestamp_from_json(const nlohmann::json& value, uint64_t now) {
    if (value.is_null()) return 0;
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        return v <= kMaxEpochSeconds ? v : now;
    }
    if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        if (v < 0 || static_cast<uint64_t>(v) > kMaxEpochSeconds) return now;
        return static_cast<uint64_t>(v);
    }
    if (value.is_number_float()) {
        auto v = value.get<double>();
        if (!std::isfinite(v) || v < 0.0 || v > static_cast<double>(kMaxEpochSeconds)) return now;
        return static_cast<uint64_t>(v);
    }
    if (value.is_string()) {
        auto parsed = parse_iso8601(value.get<std::string>());
        return parsed ? *parsed : now;
    }
    return now;
}

inline std::string string_field(const nlohmann::json& item, const char* key) {
    if (!item.contains(key) || item[key].is_null()) return {};
    if (!item[key].is_string()) {
        throw InvalidEvent(std::string("field '") + key + "' must be a string");
    }
    return item[key].get<std::string>();
}

inline std::vector<std::string> tags_from_json(const nlohmann::json& value) {
    std::vector<std::string> tags;
    if (value.is_null()) return tags;
    if (value.is_string()) {
        tags.push_back(value.get<std::string>());
        return tags;
    }
    if (!value.is_array()) {
        throw InvalidEvent("tags must be a list of strings");
    }
    for (const auto& t : value) {
        if (!t.is_string()) {
            throw InvalidEvent("tags must be a list of strings");
        }
        tags.push_back(t.get<std::string>());
    }
    return tags;
}

inline Event event_from_json(const nlohmann::json& item, uint64_t now) {
    if (!item.is_object()) {
        throw InvalidEvent("expected a JSON object, got " + std::string(item.type_name()));
    }

    Event event;
    event.id = string_field(item, "id");
    event.task_id = string_field(item, "task_id");
    event.session = string_field(item, "session");
    event.type = string_field(item, "type");
    if (event.type.empty()) event.type = string_field(item, "category");
    if (event.type.empty()) event.type = string_field(item, "cat");
    event.text = string_field(item, "text");

    if (item.contains("timestamp")) {
        event.timestamp = timestamp_from_json(item["timestamp"], now);
    } else if (item.contains("ts")) {
        event.timestamp = timestamp_from_json(item["ts"], now);
    }
    if (item.contains("expires_at")) {
        event.expires_at = timestamp_from_json(item["expires_at"], now);
    }
    if (item.contains("tags")) {
        event.tags = tags_from_json(item["tags"]);
    }

    static const char* known[] = {"id", "task_id", "session", "type", "category", "cat",
                                  "text", "timestamp", "ts", "expires_at", "tags"};
    for (auto it = item.begin(); it != item.end(); ++it) {
        bool is_known = false;
        for (const char* k : known) {
            if (it.key() == k) { is_known = true; break; }
        }
        if (!is_known) event.extra[it.key()] = it.value();
    }
    return event;
}

inline nlohmann::json event_to_json(const Event& event) {
    nlohmann::json item = event.extra.is_object() ? event.extra : nlohmann::json::object();
    item["id"] = event.id;
    item["task_id"] = event.task_id;
    item["session"] = event.session;
    item["type"] = event.type;
    item["text"] = event.text;
    item["timestamp"] = format_iso8601(event.timestamp);
    if (event.expires_at != 0) {
        item["expires_at"] = format_iso8601(event.expires_at);
    } else {
        item["expires_at"] = nullptr;
    }
    item["tags"] = event.tags;
    return item;
}

inline Document document_from_json(const nlohmann::json& item) {
    if (!item.is_object()) {
        throw MissingText("expected a JSON object, got " + std::string(item.type_name()));
    }

    Document doc;
    if (item.contains("id") && item["id"].is_string()) {
        doc.id = item["id"].get<std::string>();
    } else if (item.contains("id") && item["id"].is_number()) {
        doc.id = item["id"].dump();
    }
    if (item.contains("text") && item["text"].is_string()) {
        doc.text = item["text"].get<std::string>();
    }

    if (item.contains("metadata") && item["metadata"].is_object()) {
        const auto& md = item["metadata"];
        for (auto it = md.begin(); it != md.end(); ++it) {
            const auto& key = it.key();
            const auto& val = it.value();
            if (key == "source" && val.is_string()) {
                doc.metadata.source = val.get<std::string>();
            } else if (key == "section" && val.is_string()) {
                doc.metadata.section = val.get<std::string>();
            } else if (key == "pii" && val.is_boolean()) {
                doc.metadata.pii = val.get<bool>();
            } else if (key == "tags" && val.is_array()) {
                for (const auto& t : val) {
                    if (t.is_string()) doc.metadata.tags.push_back(t.get<std::string>());
                }
            } else if (key == "tags" && val.is_string()) {
                doc.metadata.tags.push_back(val.get<std::string>());
            } else {
                doc.metadata.extra[key] = val;
            }
        }
    }

    for (auto it = item.begin(); it != item.end(); ++it) {
        if (it.key() == "id" || it.key() == "text" || it.key() == "metadata") continue;
        doc.extra[it.key()] = it.value();
    }
    return doc;
}

inline nlohmann::json metadata_to_json(const DocumentMetadata& md) {
    nlohmann::json j = md.extra.is_object() ? md.extra : nlohmann::json::object();
    j["source"] = md.source;
    j["section"] = md.section;
    j["tags"] = md.tags;
    j["pii"] = md.pii;
    return j;
}

inline nlohmann::json document_to_json(const Document& doc) {
    nlohmann::json item = doc.extra.is_object() ? doc.extra : nlohmann::json::object();
    item["id"] = doc.id;
    item["text"] = doc.text;
    item["metadata"] = metadata_to_json(doc.metadata);
    return item;
}

} // namespace hybridmem
