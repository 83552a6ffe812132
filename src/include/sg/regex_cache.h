#pragma once

#include <cstddef>
#include <list>
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <utility>

namespace sg {

// Compiled `pattern` expressions keyed by (pattern, flags). Holds at most
// capacity() entries; inserting past that evicts the least recently used one.
class RegexCache {
  public:
    static constexpr std::size_t kDefaultCapacity = 100;

    explicit RegexCache(std::size_t capacity = kDefaultCapacity) : m_capacity(capacity) {}

    // Flags follow JavaScript RegExp letters: 'i' ignores case, 'm' makes ^ and $
    // match at line breaks, 'g', 'y' and 'u' are accepted and have no effect.
    // Throws std::regex_error for a malformed pattern and std::invalid_argument
    // for an unknown or repeated flag.
    std::shared_ptr<const std::regex> get(const std::string& pattern, const std::string& flags);

    bool contains(const std::string& pattern, const std::string& flags) const {
        return m_entries.count(Key(pattern, flags)) != 0;
    }

    std::size_t size() const noexcept { return m_entries.size(); }
    std::size_t capacity() const noexcept { return m_capacity; }

    void clear() noexcept {
        m_entries.clear();
        m_order.clear();
    }

  private:
    using Key = std::pair<std::string, std::string>;

    struct Slot {
        std::shared_ptr<const std::regex> regex;
        std::list<Key>::iterator order;
    };

    static std::regex::flag_type parseFlags(const std::string& flags);

    std::size_t m_capacity;
    std::list<Key> m_order;  // most recently used first
    std::map<Key, Slot> m_entries;
};

}  // namespace sg
