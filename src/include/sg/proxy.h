#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "sg/dictionary.h"
#include "sg/traversal.h"
#include "sg/validation_error.h"
#include "sg/validator.h"

namespace sg {

class SchemaProxy;

// Result of reading through a proxy: nothing (the key is absent or not
// permitted by the schema), a copy of a scalar, or a proxy over a nested
// array/object.
using ProxyValue = std::variant<std::monostate, Dictionary, SchemaProxy>;

// A schema-governed view of a container value. Reads hand out governed views
// of nested containers; writes are validated against the property schema
// before they reach the target; required properties cannot be erased.
//
// The proxy does not own the root value or the schema. A nested proxy keeps
// the root and the key path down to its container and walks that path on
// every access, so it stays safe while its parents grow, shrink or are
// replaced. Once the path no longer leads to a container, reads come back
// absent and writes are refused. Callers go through these methods
// explicitly; there is no way to redefine or call the wrapped value.
class SchemaProxy {
  public:
    // Throws std::invalid_argument unless `target` is an array or object.
    SchemaProxy(Dictionary& target, const Dictionary& schema, std::shared_ptr<ValidationEngine> engine);

    ProxyValue get(const PathKey& key) const;

    // Validates a copy of `value` against the schema governing `key` and, if it
    // conforms, stores it. Writing one past the end of an array appends.
    std::optional<ValidationError> set(const PathKey& key, const Dictionary& value);

    // Removes `key` unless the schema lists it as required. Erasing an array
    // index shifts the following elements down without re-validating them, so
    // under a tuple `items` schema the shifted elements may no longer match
    // their new positions.
    std::optional<ValidationError> erase(const PathKey& key);

    bool has(const PathKey& key) const;

    // Object property names, or array indices as decimal strings.
    std::vector<std::string> keys() const;

    int size() const;

    // The wrapped container, or nullptr when the path to it is gone.
    const Dictionary* target() const { return resolveTarget(); }
    const Dictionary& schema() const { return *m_schema; }

    // Keys leading from the root value to the wrapped container.
    const std::vector<PathKey>& path() const { return m_path; }

  private:
    SchemaProxy(Dictionary& root,
                std::vector<PathKey> path,
                const Dictionary& schema,
                std::shared_ptr<ValidationEngine> engine);

    // Container at the end of m_path, or nullptr when a step is missing or
    // the value found there is no longer an array or object.
    Dictionary* resolveTarget() const;

    // Normalizes a key for the target: digit strings become indices on
    // arrays, indices become names on objects.
    static PathKey targetKey(const Dictionary& target, const PathKey& key);

    std::optional<ValidationError> refuse(const std::string& message, const Dictionary& value) const;

    Dictionary* m_root;
    std::vector<PathKey> m_path;
    const Dictionary* m_schema;
    std::shared_ptr<ValidationEngine> m_engine;
};

// Value held by a ProxyValue, or nullptr for the absent and proxy cases.
inline const Dictionary* scalarOf(const ProxyValue& v) { return std::get_if<Dictionary>(&v); }

inline const SchemaProxy* proxyOf(const ProxyValue& v) { return std::get_if<SchemaProxy>(&v); }

}  // namespace sg
