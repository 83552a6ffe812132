#include "sg/schema_resolver.h"
#include <cctype>

namespace sg {

const Dictionary& unconstrainedSchema() {
    static const Dictionary unconstrained;
    return unconstrained;
}

const Dictionary* schemaField(const Dictionary& schema, const std::string& name) {
    if (!schema.isMappedObject() || !schema.has(name)) return nullptr;
    return &schema.at(name);
}

std::string valueTypeName(const Dictionary& value) {
    switch (value.type()) {
        case Dictionary::Null:
            return "null";
        case Dictionary::Boolean:
            return "boolean";
        case Dictionary::Integer:
        case Dictionary::Double:
            return "number";
        case Dictionary::String:
            return "string";
        case Dictionary::Array:
            return "array";
        case Dictionary::Object:
            return "object";
    }
    return "unknown";
}

static bool isValueType(const Dictionary& value, const std::string& type, const Dictionary& schema_type) {
    if (!schema_type.isString()) return false;
    const std::string expected = schema_type.asString();
    return type == expected || (expected == "integer" && value.isIntegral());
}

bool isValueTypeAny(const Dictionary& value, const Dictionary& schema) {
    const Dictionary* schema_type = schemaField(schema, "type");
    if (schema_type == nullptr) return true;
    const std::string type = valueTypeName(value);
    if (schema_type->isString()) return isValueType(value, type, *schema_type);
    if (schema_type->isArrayObject()) {
        for (auto const& t : schema_type->elements()) {
            if (isValueType(value, type, t)) return true;
        }
        return false;
    }
    return true;
}

std::string schemaOrValueType(const Dictionary& schema, const Dictionary* value) {
    const Dictionary* type = schemaField(schema, "type");
    if (type == nullptr) {
        return value != nullptr ? valueTypeName(*value) : std::string();
    }
    if (type->isArrayObject()) {
        if (value == nullptr) return std::string();
        const Dictionary value_type(valueTypeName(*value));
        for (auto const& t : type->elements()) {
            if (t == value_type) return value_type.asString();
        }
        return std::string();
    }
    if (type->isString()) return type->asString();
    return std::string();
}

// Array index named by a key, or -1 when the key is not an index.
static int indexOf(const PathKey& key) {
    if (auto n = std::get_if<int>(&key)) return *n;
    if (auto s = std::get_if<std::string>(&key)) {
        if (s->empty() || s->size() > 9) return -1;
        for (char c : *s) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return -1;
        }
        return std::stoi(*s);
    }
    return -1;
}

// additionalProperties / additionalItems: false forbids, a schema governs,
// anything else leaves the member unconstrained.
static const Dictionary* resolveAdditional(const Dictionary& schema, const char* keyword, SchemaPath* path) {
    const Dictionary* additional = schemaField(schema, keyword);
    if (additional != nullptr && additional->isBool() && !additional->asBool()) {
        return nullptr;
    }
    if (additional != nullptr && additional->isMappedObject()) {
        if (path != nullptr) path->push_back({PathKey(std::string(keyword)), additional});
        return additional;
    }
    const Dictionary* result = &unconstrainedSchema();
    if (path != nullptr) path->push_back({PathKey{}, result});
    return result;
}

const Dictionary* resolveProperty(const Dictionary& schema,
                                  const PathKey& key,
                                  const Dictionary* container,
                                  SchemaPath* path) {
    const std::string type = schemaOrValueType(schema, container);
    if (type == "object") {
        const Dictionary* properties = schemaField(schema, "properties");
        if (properties != nullptr && properties->isMappedObject()) {
            const std::string name = to_string(key);
            if (properties->has(name)) {
                const Dictionary& property_schema = properties->at(name);
                if (property_schema.isMappedObject()) {
                    if (path != nullptr) {
                        path->push_back({PathKey(std::string("properties")), properties});
                        path->push_back({PathKey(name), &property_schema});
                    }
                    return &property_schema;
                }
            }
        }
        return resolveAdditional(schema, "additionalProperties", path);
    }

    if (type == "array") {
        const Dictionary* items = schemaField(schema, "items");
        if (items != nullptr && items->isMappedObject()) {
            return items;
        }
        if (items != nullptr && items->isArrayObject()) {
            const int index = indexOf(key);
            if (index >= 0 && index < items->size()) {
                const Dictionary& item_schema = items->at(index);
                if (item_schema.isMappedObject()) {
                    if (path != nullptr) {
                        path->push_back({PathKey(std::string("items")), items});
                        path->push_back({PathKey(index), &item_schema});
                    }
                    return &item_schema;
                }
            }
        }
        return resolveAdditional(schema, "additionalItems", path);
    }

    return nullptr;
}

}  // namespace sg
