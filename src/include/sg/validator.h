#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "sg/dictionary.h"
#include "sg/regex_cache.h"
#include "sg/traversal.h"
#include "sg/validation_error.h"

namespace sg {

// Interprets schema nodes against values. The only state is the cache of
// compiled `pattern` expressions, so one engine can serve many validations.
class ValidationEngine {
  public:
    explicit ValidationEngine(std::size_t regex_cache_capacity = RegexCache::kDefaultCapacity)
        : m_regex_cache(regex_cache_capacity) {}

    // Checks `value` against `schema`, recursing into array items and object
    // properties. Returns the first failure, or std::nullopt when the value
    // conforms. `info` must be rooted at the value being validated; it is
    // left balanced on return.
    std::optional<ValidationError> validate(const Dictionary& value, const Dictionary& schema, TraversalInfo& info);

    const RegexCache& regexCache() const { return m_regex_cache; }

  private:
    std::optional<ValidationError> validateSingleSchema(const Dictionary& value,
                                                        const Dictionary& schema,
                                                        TraversalInfo& info);
    std::optional<ValidationError> validateConditional(const Dictionary& value,
                                                       const Dictionary& schema,
                                                       TraversalInfo& info);
    std::optional<ValidationError> validateAllOf(const Dictionary& value,
                                                 const Dictionary& schema,
                                                 TraversalInfo& info);
    std::optional<ValidationError> validateAnyOf(const Dictionary& value,
                                                 const Dictionary& schema,
                                                 TraversalInfo& info);
    std::optional<ValidationError> validateOneOf(const Dictionary& value,
                                                 const Dictionary& schema,
                                                 TraversalInfo& info);
    std::optional<ValidationError> validateNoneOf(const Dictionary& value,
                                                  const Dictionary& schema,
                                                  TraversalInfo& info);

    std::optional<ValidationError> validateNumber(const Dictionary& value,
                                                  const Dictionary& schema,
                                                  TraversalInfo& info);
    std::optional<ValidationError> validateString(const Dictionary& value,
                                                  const Dictionary& schema,
                                                  TraversalInfo& info);
    std::optional<ValidationError> validateArray(const Dictionary& value,
                                                 const Dictionary& schema,
                                                 TraversalInfo& info);
    std::optional<ValidationError> validateObject(const Dictionary& value,
                                                  const Dictionary& schema,
                                                  TraversalInfo& info);

    // Runs a sub-validation whose failure the caller only counts.
    bool matches(const Dictionary& value, const Dictionary& schema, TraversalInfo& info);

    ValidationError fail(const std::string& message,
                         const Dictionary& value,
                         const Dictionary& schema,
                         const TraversalInfo& info) const;

    RegexCache m_regex_cache;
    int m_speculative_depth = 0;
};

// Length of a UTF-8 string in UTF-16 code units: code points above U+FFFF
// count twice, everything else once.
size_t utf16Length(const std::string& s);

}  // namespace sg
