#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace hybridmem {

// Unix epoch seconds
uint64_t epoch_seconds();

// Latest representable timestamp: 9999-12-31T23:59:59Z
constexpr uint64_t kMaxEpochSeconds = 253402300799ULL;

// ISO 8601 UTC timestamp for the given epoch seconds ("2024-05-01T12:00:00Z").
// Values past kMaxEpochSeconds are clamped to it.
std::string format_iso8601(uint64_t epoch);

// Parse an ISO 8601 timestamp ("YYYY-MM-DDTHH:MM:SS", optional fractional
// seconds, optional "Z" or +HH:MM offset). Returns nullopt if unparsable.
std::optional<uint64_t> parse_iso8601(const std::string& s);

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Split on runs of whitespace, dropping empty pieces
std::vector<std::string> split_words(const std::string& s);

// Estimate token cost of text: max(1, round(word_count * 1.3))
uint32_t estimate_tokens(const std::string& text);

// Replace email-like substrings with "<EMAIL>"
std::string redact_emails(const std::string& text);

// Parse a boolean flag ("1", "true", "yes", "on", case-insensitive)
bool parse_flag(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace hybridmem
