#include "sg/traversal.h"
#include "sg/validation_error.h"

namespace sg {

std::string to_string(const PathKey& key) {
    if (auto s = std::get_if<std::string>(&key)) return *s;
    if (auto n = std::get_if<int>(&key)) return std::to_string(*n);
    return std::string();
}

static std::string display_path(const std::vector<PathKey>& keys) {
    std::string out = "root";
    for (auto const& k : keys) {
        if (std::holds_alternative<std::monostate>(k)) continue;
        out.push_back('/');
        out.append(to_string(k));
    }
    return out;
}

std::string ValidationError::path() const { return display_path(value_path); }

std::string ValidationError::schemaLocation() const { return display_path(schema_path); }

}  // namespace sg
