#include "sg/validate.h"
#include "sg/debug.h"
#include "sg/schema_resolver.h"
#include <algorithm>
#include <iostream>

namespace sg {

// Canonical empty value for a single `type` name; null for anything else.
static Dictionary default_type_value(const Dictionary* type) {
    if (type == nullptr || !type->isString()) return Dictionary::null();
    const std::string t = type->asString();
    if (t == "boolean") return Dictionary(false);
    if (t == "number" || t == "integer") return Dictionary(0);
    if (t == "string") return Dictionary(std::string());
    if (t == "array") return Dictionary::array();
    if (t == "object") return Dictionary();
    return Dictionary::null();
}

static Dictionary valid_value_or_default(const Dictionary& schema, Dictionary value);

static void populate_object_defaults(Dictionary& value, const Dictionary& schema) {
    std::vector<std::string> properties = value.keys();

    const Dictionary* required = schemaField(schema, "required");
    if (required != nullptr && required->isArrayObject()) {
        for (auto const& entry : required->elements()) {
            if (!entry.isString()) continue;
            const std::string property = entry.asString();
            properties.erase(std::remove(properties.begin(), properties.end(), property), properties.end());

            const Dictionary* property_schema = resolveProperty(schema, property, &value);
            if (property_schema == nullptr) continue;
            Dictionary current = value.has(property) ? value.at(property) : Dictionary::null();
            value[property] = valid_value_or_default(*property_schema, std::move(current));
        }
    }

    for (auto const& property : properties) {
        const Dictionary* property_schema = resolveProperty(schema, property, &value);
        if (property_schema == nullptr) {
            if (debugEnabled()) std::cerr << "defaults: dropping property '" << property << "'\n";
            value.erase(property);
        } else {
            value[property] = valid_value_or_default(*property_schema, std::move(value.at(property)));
        }
    }
}

static void populate_array_defaults(Dictionary& value, const Dictionary& schema) {
    for (int i = 0; i < value.size(); ++i) {
        const Dictionary* property_schema = resolveProperty(schema, i, &value);
        if (property_schema == nullptr) continue;
        value.at(i) = valid_value_or_default(*property_schema, std::move(value.at(i)));
    }
}

static Dictionary valid_value_or_default(const Dictionary& schema, Dictionary value) {
    if (!isValueTypeAny(value, schema)) {
        bool assign_default = true;

        const Dictionary* schema_default = schemaField(schema, "default");
        if (schema_default != nullptr) {
            value = clone(*schema_default);
            assign_default = !isValueTypeAny(value, schema);
        }

        if (assign_default) {
            value = default_type_value(schemaField(schema, "type"));
        }

        if (debugEnabled()) std::cerr << "defaults: substituted " << value.dump() << "\n";
    }

    switch (value.type()) {
        case Dictionary::Object:
            populate_object_defaults(value, schema);
            break;
        case Dictionary::Array:
            populate_array_defaults(value, schema);
            break;
        default:
            break;
    }

    return value;
}

Dictionary getValidValueOrDefault(const Dictionary& schema, const Dictionary& value) {
    return valid_value_or_default(schema, value);
}

}  // namespace sg
