#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "sg/dictionary.h"

namespace sg {

// One step in a value or schema path: none (the root), a property name,
// or an array index.
using PathKey = std::variant<std::monostate, std::string, int>;

std::string to_string(const PathKey& key);

// Segments a schema lookup went through, e.g. ("properties", props), ("a", schema).
using SchemaPath = std::vector<std::pair<PathKey, const Dictionary*> >;

// Root-to-current stacks of the value and schema nodes visited during one
// validation, used to say where a failure happened. Entries point into the
// trees being validated and are only valid while the walk is in progress.
class TraversalInfo {
  public:
    struct Entry {
        PathKey key;
        const Dictionary* node;
    };

    TraversalInfo(const Dictionary& value, const Dictionary& schema) {
        valuePush(PathKey{}, value);
        schemaPush(PathKey{}, schema);
    }

    void valuePush(PathKey key, const Dictionary& value) { m_value_path.push_back({std::move(key), &value}); }
    void valuePop() { m_value_path.pop_back(); }

    void schemaPush(PathKey key, const Dictionary& schema) { m_schema_path.push_back({std::move(key), &schema}); }
    void schemaPop() { m_schema_path.pop_back(); }

    const std::vector<Entry>& valuePath() const { return m_value_path; }
    const std::vector<Entry>& schemaPath() const { return m_schema_path; }

    std::vector<PathKey> valueKeys() const { return keysOf(m_value_path); }
    std::vector<PathKey> schemaKeys() const { return keysOf(m_schema_path); }

  private:
    static std::vector<PathKey> keysOf(const std::vector<Entry>& path) {
        std::vector<PathKey> out;
        out.reserve(path.size());
        for (auto const& e : path) out.push_back(e.key);
        return out;
    }

    std::vector<Entry> m_value_path;
    std::vector<Entry> m_schema_path;
};

// Keeps a schema path entry pushed for the lifetime of the scope.
class SchemaScope {
  public:
    SchemaScope(TraversalInfo& info, PathKey key, const Dictionary& schema) : m_info(info) {
        m_info.schemaPush(std::move(key), schema);
    }
    ~SchemaScope() { m_info.schemaPop(); }
    SchemaScope(const SchemaScope&) = delete;
    SchemaScope& operator=(const SchemaScope&) = delete;

  private:
    TraversalInfo& m_info;
};

// Pushes a resolver path and the matching value entry; pops both on exit.
class PropertyScope {
  public:
    PropertyScope(TraversalInfo& info, const SchemaPath& schema_path, PathKey key, const Dictionary& value)
        : m_info(info), m_schema_count(schema_path.size()) {
        for (auto const& p : schema_path) m_info.schemaPush(p.first, *p.second);
        m_info.valuePush(std::move(key), value);
    }
    ~PropertyScope() {
        m_info.valuePop();
        for (size_t i = 0; i < m_schema_count; ++i) m_info.schemaPop();
    }
    PropertyScope(const PropertyScope&) = delete;
    PropertyScope& operator=(const PropertyScope&) = delete;

  private:
    TraversalInfo& m_info;
    size_t m_schema_count;
};

}  // namespace sg
