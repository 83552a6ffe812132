#include "sg/regex_cache.h"
#include <stdexcept>

namespace sg {

std::regex::flag_type RegexCache::parseFlags(const std::string& flags) {
    std::regex::flag_type out = std::regex::ECMAScript;
    std::string seen;
    for (char f : flags) {
        if (seen.find(f) != std::string::npos)
            throw std::invalid_argument("Invalid flags supplied to RegExp constructor '" + flags + "'");
        seen.push_back(f);
        switch (f) {
            case 'i':
                out |= std::regex::icase;
                break;
            case 'm':
                out |= std::regex::multiline;
                break;
            case 'g':
            case 'y':
            case 'u':
                break;
            default:
                throw std::invalid_argument("Invalid flags supplied to RegExp constructor '" + flags + "'");
        }
    }
    return out;
}

std::shared_ptr<const std::regex> RegexCache::get(const std::string& pattern, const std::string& flags) {
    Key key(pattern, flags);
    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        m_order.splice(m_order.begin(), m_order, it->second.order);
        return it->second.regex;
    }

    auto compiled = std::make_shared<const std::regex>(pattern, parseFlags(flags));
    if (m_capacity == 0) return compiled;

    while (m_entries.size() >= m_capacity) {
        m_entries.erase(m_order.back());
        m_order.pop_back();
    }
    m_order.push_front(key);
    m_entries.emplace(std::move(key), Slot{compiled, m_order.begin()});
    return compiled;
}

}  // namespace sg
