#pragma once

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <iomanip>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sg {

struct DictionaryScalarImpl {
    bool m_bool = false;
    double m_double = 0.0;
    int64_t m_int = 0;
    std::string m_string = "";
};

// A JSON-like value: null, boolean, number (stored as Integer or Double),
// string, array or string-keyed object. Copies are deep.
struct Dictionary {
    enum TYPE { Object, Boolean, String, Integer, Double, Array, Null };

  private:
    TYPE my_type = Object;
    DictionaryScalarImpl scalar;

    std::vector<Dictionary> m_array;
    std::map<std::string, Dictionary> m_object_map;

  public:
    Dictionary() { my_type = TYPE::Object; }
    ~Dictionary() = default;

    Dictionary(const Dictionary& d) = default;
    Dictionary(Dictionary&& d) = default;

    Dictionary(const std::string& s) {
        my_type = TYPE::String;
        scalar.m_string = s;
    }

    Dictionary(std::string&& s) {
        my_type = TYPE::String;
        scalar.m_string = std::move(s);
    }

    Dictionary(const char* s) : Dictionary(std::string(s)) {}

    Dictionary(int64_t n) {
        my_type = TYPE::Integer;
        scalar.m_int = n;
    }

    Dictionary(int n) : Dictionary(int64_t(n)) {}

    Dictionary(double x) {
        my_type = TYPE::Double;
        scalar.m_double = x;
    }

    Dictionary(bool b) {
        my_type = TYPE::Boolean;
        scalar.m_bool = b;
    }

    Dictionary(const std::vector<Dictionary>& v) : m_array(v) { my_type = TYPE::Array; }

    Dictionary(std::vector<Dictionary>&& v) : m_array(std::move(v)) { my_type = TYPE::Array; }

    // Construct an object from initializer list of (key, value) pairs
    Dictionary(std::initializer_list<std::pair<std::string, Dictionary> > init) {
        my_type = TYPE::Object;
        for (auto const& p : init) {
            m_object_map[p.first] = p.second;
        }
    }

    // Construct an array from an initializer list of convertible values
    template <typename T,
              typename = std::enable_if_t<
                          !std::is_same<std::decay_t<T>,
                                        std::pair<std::string, Dictionary> >::value> >
    Dictionary(std::initializer_list<T> init) {
        my_type = TYPE::Array;
        m_array.reserve(init.size());
        for (auto const& v : init) m_array.emplace_back(v);
    }

    static Dictionary null() {
        Dictionary d;
        d.my_type = TYPE::Null;
        return d;
    }

    static Dictionary array() {
        Dictionary d;
        d.my_type = TYPE::Array;
        return d;
    }

    // Copy into a temporary first so assigning from a sub-element
    // (e.g. `dict = dict["key"]`) is safe.
    Dictionary& operator=(const Dictionary& d) {
        if (this == &d) return *this;
        Dictionary tmp(d);
        swap(tmp);
        return *this;
    }

    Dictionary& operator=(Dictionary&& d) noexcept {
        if (this == &d) return *this;
        Dictionary tmp(std::move(d));
        swap(tmp);
        return *this;
    }

    void swap(Dictionary& other) noexcept {
        std::swap(my_type, other.my_type);
        std::swap(scalar, other.scalar);
        m_array.swap(other.m_array);
        m_object_map.swap(other.m_object_map);
    }

    // Structural equality. Integer and Double compare by numeric value.
    bool operator==(const Dictionary& rhs) const {
        if (isNumber() && rhs.isNumber()) {
            if (my_type == TYPE::Integer && rhs.my_type == TYPE::Integer)
                return scalar.m_int == rhs.scalar.m_int;
            return asDouble() == rhs.asDouble();
        }
        if (my_type != rhs.my_type) return false;
        switch (my_type) {
            case TYPE::Boolean:
                return scalar.m_bool == rhs.scalar.m_bool;
            case TYPE::String:
                return scalar.m_string == rhs.scalar.m_string;
            case TYPE::Array:
                return m_array == rhs.m_array;
            case TYPE::Object:
                return m_object_map == rhs.m_object_map;
            case TYPE::Null:
                return true;
            default:
                break;
        }
        return false;
    }

    bool operator!=(const Dictionary& rhs) const { return not(*this == rhs); }

    int count(const std::string& key) const {
        if (my_type != TYPE::Object) return 0;
        return static_cast<int>(m_object_map.count(key));
    }

    bool has(const std::string& key) const noexcept { return count(key) == 1; }
    bool contains(const std::string& k) const noexcept { return has(k); }

    int size() const noexcept {
        switch (my_type) {
            case TYPE::Array:
                return static_cast<int>(m_array.size());
            case TYPE::Object:
                return static_cast<int>(m_object_map.size());
            default:
                return 0;
        }
    }

    bool empty() const noexcept {
        switch (my_type) {
            case TYPE::Object:
                return m_object_map.empty();
            case TYPE::Array:
                return m_array.empty();
            default:
                return false;
        }
    }

    Dictionary& erase(const std::string& k) {
        if (my_type == TYPE::Object) {
            m_object_map.erase(k);
        }
        return *this;
    }

    // Remove an array element; later elements shift down by one.
    Dictionary& eraseAt(int index) {
        if (my_type == TYPE::Array && index >= 0 && index < size()) {
            m_array.erase(m_array.begin() + index);
        }
        return *this;
    }

    void push_back(const Dictionary& v) {
        if (my_type == TYPE::Object && m_object_map.empty()) my_type = TYPE::Array;
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        m_array.push_back(v);
    }

    void push_back(Dictionary&& v) {
        if (my_type == TYPE::Object && m_object_map.empty()) my_type = TYPE::Array;
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        m_array.push_back(std::move(v));
    }

    void clear() noexcept {
        m_object_map.clear();
        m_array.clear();
        my_type = TYPE::Object;
    }

    TYPE type() const { return my_type; }

    std::string typeString() const {
        switch (my_type) {
            case TYPE::Object:
                return "Object";
            case TYPE::Boolean:
                return "Boolean";
            case TYPE::Double:
                return "Double";
            case TYPE::Integer:
                return "Integer";
            case TYPE::String:
                return "String";
            case TYPE::Array:
                return "Array";
            case TYPE::Null:
                return "Null";
            default:
                throw std::logic_error("Not a valid type");
        }
    }

    // Mutable index access. An empty object turns into an array on first
    // use, and the array grows with nulls up to `index`.
    Dictionary& operator[](int index) {
        if (my_type == TYPE::Object && m_object_map.empty()) {
            my_type = TYPE::Array;
            m_array.clear();
        }
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        if (index < 0) throw std::logic_error("Negative index");
        while (static_cast<int>(m_array.size()) <= index) m_array.push_back(Dictionary::null());
        return m_array[static_cast<size_t>(index)];
    }

    const Dictionary& operator[](int index) const { return at(index); }

    Dictionary& operator[](const std::string& k) {
        if (my_type != TYPE::Object) {
            clear();
        }
        return m_object_map[k];
    }

    Dictionary& operator[](const char* k) { return operator[](std::string(k)); }

    const Dictionary& operator[](const std::string& k) const { return at(k); }

    Dictionary& at(int index) {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        if (index < 0 || index >= size()) throw std::out_of_range("Index " + std::to_string(index) + " out of range");
        return m_array[static_cast<size_t>(index)];
    }

    const Dictionary& at(int index) const {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        if (index < 0 || index >= size()) throw std::out_of_range("Index " + std::to_string(index) + " out of range");
        return m_array[static_cast<size_t>(index)];
    }

    const Dictionary& at(const std::string& k) const {
        auto it = m_object_map.find(k);
        if (my_type == TYPE::Object && it != m_object_map.end()) return it->second;
        throw std::out_of_range(missingKeyMessage(k));
    }

    Dictionary& at(const std::string& k) {
        auto it = m_object_map.find(k);
        if (my_type == TYPE::Object && it != m_object_map.end()) return it->second;
        throw std::out_of_range(missingKeyMessage(k));
    }

    std::vector<std::string> keys() const {
        if (my_type != TYPE::Object) {
            return {};
        }
        std::vector<std::string> out;
        out.reserve(m_object_map.size());
        for (auto const& p : m_object_map) out.push_back(p.first);
        return out;
    }

    std::vector<std::pair<std::string, Dictionary> > items() const {
        if (my_type != TYPE::Object) {
            throw std::logic_error("Cannot get items of non-object type");
        }
        return std::vector<std::pair<std::string, Dictionary> >(m_object_map.begin(), m_object_map.end());
    }

    const std::vector<Dictionary>& elements() const {
        if (my_type != TYPE::Array) {
            throw std::logic_error("Cannot get elements of non-array type");
        }
        return m_array;
    }

    std::string asString() const {
        if (my_type == TYPE::String) return scalar.m_string;
        if (my_type == TYPE::Integer) return std::to_string(scalar.m_int);
        if (my_type == TYPE::Double) return formatNumber(scalar.m_double);
        if (my_type == TYPE::Boolean) return scalar.m_bool ? "true" : "false";
        throw std::runtime_error("not a string");
    }

    int64_t asInt64() const {
        if (my_type == TYPE::Integer) return scalar.m_int;
        if (my_type == TYPE::Double) return static_cast<int64_t>(scalar.m_double);
        throw std::runtime_error("not an int");
    }

    int asInt() const { return static_cast<int>(asInt64()); }

    double asDouble() const {
        if (my_type == TYPE::Double) return scalar.m_double;
        if (my_type == TYPE::Integer) return static_cast<double>(scalar.m_int);
        throw std::runtime_error("not a double");
    }

    bool asBool() const {
        if (my_type == TYPE::Boolean) return scalar.m_bool;
        throw std::runtime_error("not a bool");
    }

    bool isValueObject() const {
        switch (my_type) {
            case TYPE::Object:
            case TYPE::Array:
            case TYPE::Null:
                return false;
            default:
                return true;
        }
    }

    bool isArrayObject() const { return my_type == TYPE::Array; }
    bool isMappedObject() const { return my_type == TYPE::Object; }
    bool isContainer() const { return isArrayObject() || isMappedObject(); }

    bool isNumber() const { return my_type == TYPE::Integer || my_type == TYPE::Double; }
    bool isInt() const { return my_type == TYPE::Integer; }
    bool isDouble() const { return my_type == TYPE::Double; }
    bool isString() const { return my_type == TYPE::String; }
    bool isBool() const { return my_type == TYPE::Boolean; }
    bool isNull() const { return my_type == TYPE::Null; }

    // A number with no fractional part, whichever way it is stored.
    bool isIntegral() const {
        if (my_type == TYPE::Integer) return true;
        if (my_type == TYPE::Double) return std::isfinite(scalar.m_double) && std::floor(scalar.m_double) == scalar.m_double;
        return false;
    }

    std::string dump(int indent = 0) const;

    static std::string formatNumber(double x) {
        if (std::isnan(x)) return "NaN";
        if (std::isinf(x)) return x > 0 ? "Infinity" : "-Infinity";
        std::ostringstream ss;
        ss << std::setprecision(15) << x;
        return ss.str();
    }

  private:
    std::string missingKeyMessage(const std::string& k) const {
        std::ostringstream ss;
        ss << "Could not find key <" << k << "> available options are: ";
        bool first = true;
        for (auto const& p : m_object_map) {
            if (!first) ss << ",";
            first = false;
            ss << '"' << p.first << '"';
        }
        return ss.str();
    }

    void dumpTo(std::ostream& out, int indent, int level) const;
};

static inline std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream ss;
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(static_cast<unsigned char>(c));
                    result += ss.str();
                } else {
                    result.push_back(c);
                }
                break;
        }
    }
    result.push_back('"');
    return result;
}

inline void Dictionary::dumpTo(std::ostream& out, int indent, int level) const {
    const bool pretty = indent > 0;
    auto newline = [&](int lvl) {
        if (!pretty) return;
        out << '\n' << std::string(static_cast<size_t>(lvl * indent), ' ');
    };
    switch (my_type) {
        case TYPE::Null:
            out << "null";
            return;
        case TYPE::Boolean:
            out << (scalar.m_bool ? "true" : "false");
            return;
        case TYPE::Integer:
            out << scalar.m_int;
            return;
        case TYPE::Double:
            out << formatNumber(scalar.m_double);
            return;
        case TYPE::String:
            out << escape_json_string(scalar.m_string);
            return;
        case TYPE::Array: {
            if (m_array.empty()) {
                out << "[]";
                return;
            }
            out << '[';
            for (size_t i = 0; i < m_array.size(); ++i) {
                if (i) out << ',';
                newline(level + 1);
                m_array[i].dumpTo(out, indent, level + 1);
            }
            newline(level);
            out << ']';
            return;
        }
        case TYPE::Object: {
            if (m_object_map.empty()) {
                out << "{}";
                return;
            }
            out << '{';
            bool first = true;
            for (auto const& p : m_object_map) {
                if (!first) out << ',';
                first = false;
                newline(level + 1);
                out << escape_json_string(p.first) << (pretty ? ": " : ":");
                p.second.dumpTo(out, indent, level + 1);
            }
            newline(level);
            out << '}';
            return;
        }
    }
}

inline std::string Dictionary::dump(int indent) const {
    std::ostringstream out;
    dumpTo(out, indent, 0);
    return out.str();
}

inline std::ostream& operator<<(std::ostream& os, const Dictionary& d) {
    os << d.dump();
    return os;
}

}  // namespace sg
