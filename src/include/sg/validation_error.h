#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "sg/dictionary.h"
#include "sg/traversal.h"

namespace sg {

// A failed validation. Carries copies of the offending value and the schema
// node that rejected it, plus the value/schema path keys (root first) at the
// moment of failure. Derives from std::runtime_error so it can be thrown.
// Errors raised inside a combinator branch that is only being tried carry
// the message and paths but leave `value` and `schema` null.
struct ValidationError : public std::runtime_error {
    Dictionary value;
    Dictionary schema;
    std::vector<PathKey> value_path;
    std::vector<PathKey> schema_path;

    ValidationError(const std::string& message,
                    const Dictionary& v,
                    const Dictionary& s,
                    const TraversalInfo& info)
        : std::runtime_error(message),
          value(v),
          schema(s),
          value_path(info.valueKeys()),
          schema_path(info.schemaKeys()) {}

    ValidationError(const std::string& message, const TraversalInfo& info)
        : std::runtime_error(message),
          value(Dictionary::null()),
          schema(Dictionary::null()),
          value_path(info.valueKeys()),
          schema_path(info.schemaKeys()) {}

    // Folder-style location of the offending value, e.g. "root/general/0".
    std::string path() const;

    // Same, for the schema node, e.g. "root/properties/general/items/0".
    std::string schemaLocation() const;
};

}  // namespace sg
