#pragma once

#include <optional>
#include "sg/dictionary.h"
#include "sg/proxy.h"
#include "sg/validation_error.h"

namespace sg {

// Validate `value` against `schema`.
// Returns std::nullopt on success, or the first failure found.
std::optional<ValidationError> validate(const Dictionary& value, const Dictionary& schema);

// Return a value that satisfies the schema's type constraints, keeping what is
// already valid in `value`: mismatched values are replaced by the schema's
// `default` (or an empty value of the declared type), required properties are
// filled in, and properties the schema does not permit are dropped. Never fails.
Dictionary getValidValueOrDefault(const Dictionary& schema, const Dictionary& value);

// Wrap `target` in a proxy that validates every write against `schema`.
// Both must outlive the returned proxy and any proxy read out of it.
SchemaProxy createProxy(Dictionary& target, const Dictionary& schema);

// Deep copy of a value.
Dictionary clone(const Dictionary& value);

}  // namespace sg
