#include "filters.hpp"
#include <algorithm>

namespace hybridmem {

static bool has_tag(const std::vector<std::string>& tags, const std::string& tag) {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

bool tags_match(const std::vector<std::string>& tags, const nlohmann::json& wanted) {
    if (wanted.is_null()) return true;

    if (wanted.is_string()) return has_tag(tags, wanted.get<std::string>());

    if (wanted.is_array()) {
        for (const auto& t : wanted) {
            if (!t.is_string() || !has_tag(tags, t.get<std::string>())) return false;
        }
        return true;
    }

    // Numbers, booleans and objects never name a tag
    return false;
}

bool matches_filters(const Filters& filters, const FieldLookup& field,
                     const std::vector<std::string>& tags) {
    if (!filters.is_object()) return true;

    for (auto it = filters.begin(); it != filters.end(); ++it) {
        if (it.key() == "tags") {
            if (!tags_match(tags, it.value())) return false;
        } else if (field(it.key()) != it.value()) {
            return false;
        }
    }
    return true;
}

} // namespace hybridmem
