#pragma once

#include <sg/dictionary.h>
#include <stdexcept>
#include <string>

namespace sg {

struct JsonParseError : public std::runtime_error {
    size_t line, col;
    JsonParseError(const std::string& msg, size_t l, size_t c)
        : std::runtime_error(msg), line(l), col(c) {}
};

// Parse JSON text (comments allowed) into a Dictionary.
// Throws JsonParseError with the line/column of the first problem.
Dictionary parse_json(const std::string& text);

namespace json_literals {
    inline Dictionary operator"" _json(const char* s, std::size_t len) {
        return parse_json(std::string(s, len));
    }
}

}  // namespace sg
