#include "sg/proxy.h"
#include "sg/debug.h"
#include "sg/schema_resolver.h"
#include "sg/validate.h"
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace sg {

SchemaProxy::SchemaProxy(Dictionary& target, const Dictionary& schema, std::shared_ptr<ValidationEngine> engine)
    : m_root(&target), m_schema(&schema), m_engine(std::move(engine)) {
    if (!target.isContainer()) {
        throw std::invalid_argument("Cannot create a proxy over a " + valueTypeName(target) + " value");
    }
}

SchemaProxy::SchemaProxy(Dictionary& root,
                         std::vector<PathKey> path,
                         const Dictionary& schema,
                         std::shared_ptr<ValidationEngine> engine)
    : m_root(&root), m_path(std::move(path)), m_schema(&schema), m_engine(std::move(engine)) {}

Dictionary* SchemaProxy::resolveTarget() const {
    Dictionary* node = m_root;
    for (auto const& key : m_path) {
        if (auto index = std::get_if<int>(&key)) {
            if (!node->isArrayObject() || *index < 0 || *index >= node->size()) return nullptr;
            node = &node->at(*index);
        } else if (auto name = std::get_if<std::string>(&key)) {
            if (!node->isMappedObject() || !node->has(*name)) return nullptr;
            node = &node->at(*name);
        } else {
            return nullptr;
        }
    }
    return node->isContainer() ? node : nullptr;
}

PathKey SchemaProxy::targetKey(const Dictionary& target, const PathKey& key) {
    if (std::holds_alternative<std::monostate>(key)) return std::string();
    if (target.isArrayObject()) {
        if (auto s = std::get_if<std::string>(&key)) {
            if (s->empty() || s->size() > 9) return key;
            for (char c : *s) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return key;
            }
            return std::stoi(*s);
        }
        return key;
    }
    if (std::holds_alternative<int>(key)) return to_string(key);
    return key;
}

std::optional<ValidationError> SchemaProxy::refuse(const std::string& message, const Dictionary& value) const {
    const Dictionary* target = resolveTarget();
    const Dictionary& anchor = target != nullptr ? *target : value;
    TraversalInfo info(anchor, *m_schema);
    return ValidationError(message, value, *m_schema, info);
}

bool SchemaProxy::has(const PathKey& key) const {
    const Dictionary* target = resolveTarget();
    if (target == nullptr) return false;
    const PathKey k = targetKey(*target, key);
    if (auto index = std::get_if<int>(&k)) {
        return target->isArrayObject() && *index >= 0 && *index < target->size();
    }
    if (auto name = std::get_if<std::string>(&k)) return target->isMappedObject() && target->has(*name);
    return false;
}

ProxyValue SchemaProxy::get(const PathKey& key) const {
    Dictionary* target = resolveTarget();
    if (target == nullptr) return std::monostate{};
    const PathKey k = targetKey(*target, key);
    if (target->isArrayObject() && !std::holds_alternative<int>(k)) return std::monostate{};

    const Dictionary* property_schema = resolveProperty(*m_schema, k, target);
    if (property_schema == nullptr || !has(k)) return std::monostate{};

    Dictionary& value = std::holds_alternative<int>(k) ? target->at(std::get<int>(k))
                                                       : target->at(std::get<std::string>(k));
    if (value.isContainer()) {
        std::vector<PathKey> child_path = m_path;
        child_path.push_back(k);
        return SchemaProxy(*m_root, std::move(child_path), *property_schema, m_engine);
    }
    return value;
}

std::optional<ValidationError> SchemaProxy::set(const PathKey& key, const Dictionary& value) {
    Dictionary* target = resolveTarget();
    if (target == nullptr) return refuse("Proxy target no longer exists", value);

    const PathKey k = targetKey(*target, key);
    if (target->isArrayObject()) {
        auto index = std::get_if<int>(&k);
        if (index == nullptr || *index < 0 || *index > target->size()) {
            return refuse("Array index out of range", value);
        }
    }

    const Dictionary* property_schema = resolveProperty(*m_schema, k, target);
    if (property_schema == nullptr) {
        return refuse("Property " + to_string(k) + " not supported", value);
    }

    Dictionary copy = clone(value);
    TraversalInfo info(copy, *property_schema);
    if (auto err = m_engine->validate(copy, *property_schema, info)) {
        if (debugEnabled()) std::cerr << "proxy: rejected write to '" << to_string(k) << "': " << err->what() << "\n";
        return err;
    }

    if (auto index = std::get_if<int>(&k)) {
        if (*index == target->size())
            target->push_back(std::move(copy));
        else
            target->at(*index) = std::move(copy);
    } else {
        (*target)[std::get<std::string>(k)] = std::move(copy);
    }
    return std::nullopt;
}

std::optional<ValidationError> SchemaProxy::erase(const PathKey& key) {
    Dictionary* target = resolveTarget();
    if (target == nullptr) return refuse("Proxy target no longer exists", Dictionary::null());

    const PathKey k = targetKey(*target, key);
    const std::string name = to_string(k);

    const Dictionary* required = schemaField(*m_schema, "required");
    if (required != nullptr && required->isArrayObject()) {
        for (auto const& r : required->elements()) {
            if (r.isString() && r.asString() == name) {
                return refuse(name + " cannot be deleted", *target);
            }
        }
    }

    if (auto index = std::get_if<int>(&k)) {
        if (target->isArrayObject() && *index >= 0 && *index < target->size()) target->eraseAt(*index);
    } else if (target->isMappedObject()) {
        target->erase(name);
    }
    return std::nullopt;
}

int SchemaProxy::size() const {
    const Dictionary* target = resolveTarget();
    return target != nullptr ? target->size() : 0;
}

std::vector<std::string> SchemaProxy::keys() const {
    const Dictionary* target = resolveTarget();
    if (target == nullptr) return {};
    if (!target->isArrayObject()) return target->keys();
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(target->size()));
    for (int i = 0; i < target->size(); ++i) out.push_back(std::to_string(i));
    return out;
}

SchemaProxy createProxy(Dictionary& target, const Dictionary& schema) {
    return SchemaProxy(target, schema, std::make_shared<ValidationEngine>());
}

}  // namespace sg
