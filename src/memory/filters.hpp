#pragma once
#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace hybridmem {

// Filter mapping: field name -> expected value. A null or empty object
// matches everything. Every key except "tags" is plain JSON equality;
// "tags" takes either a list (all listed tags must be present) or a single
// string (must be present).
using Filters = nlohmann::json;

// Looks up a record field by name; returns null when the field is absent.
using FieldLookup = std::function<nlohmann::json(const std::string&)>;

bool tags_match(const std::vector<std::string>& tags, const nlohmann::json& wanted);

bool matches_filters(const Filters& filters, const FieldLookup& field,
                     const std::vector<std::string>& tags);

} // namespace hybridmem
