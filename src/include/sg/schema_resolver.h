#pragma once

#include <string>
#include "sg/dictionary.h"
#include "sg/traversal.h"

namespace sg {

// The empty schema. It accepts any value and is what a property resolves to
// when its container declares nothing tighter.
const Dictionary& unconstrainedSchema();

// Returns the named keyword of a schema node, or nullptr when the node is not
// an object or lacks the keyword.
const Dictionary* schemaField(const Dictionary& schema, const std::string& name);

// Runtime type of a value: "null", "boolean", "number", "string", "array" or
// "object". Integers and doubles are both "number".
std::string valueTypeName(const Dictionary& value);

// Whether `value` is acceptable for the schema's `type` keyword (a name or a
// list of names). "integer" accepts any number with no fractional part. A
// missing `type` accepts everything.
bool isValueTypeAny(const Dictionary& value, const Dictionary& schema);

// The container kind a schema governs: its `type` when given as a single
// name, the value's runtime type when `type` is absent or lists that type,
// otherwise an empty string.
std::string schemaOrValueType(const Dictionary& schema, const Dictionary* value);

// Finds the schema governing `key` of a container described by `schema`.
// `container` is consulted only when the schema does not name its type.
// Returns nullptr when the property is not permitted at all. When `path` is
// given, the schema keywords walked through are appended to it.
const Dictionary* resolveProperty(const Dictionary& schema,
                                  const PathKey& key,
                                  const Dictionary* container = nullptr,
                                  SchemaPath* path = nullptr);

}  // namespace sg
