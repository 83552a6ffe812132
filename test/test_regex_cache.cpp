#include <catch2/catch_all.hpp>
#include <regex>
#include <stdexcept>
#include "sg/regex_cache.h"

using namespace sg;

TEST_CASE("RegexCache returns the cached compilation", "[regex]") {
    RegexCache cache;
    REQUIRE(cache.capacity() == RegexCache::kDefaultCapacity);

    auto first = cache.get("^a+$", "");
    auto second = cache.get("^a+$", "");
    REQUIRE(first == second);
    REQUIRE(cache.size() == 1);
    REQUIRE(std::regex_search("aaa", *first));

    // flags are part of the key
    auto icase = cache.get("^a+$", "i");
    REQUIRE(icase != first);
    REQUIRE(cache.size() == 2);
    REQUIRE(std::regex_search("AAA", *icase));
    REQUIRE_FALSE(std::regex_search("AAA", *first));
}

TEST_CASE("RegexCache evicts the least recently used entry", "[regex]") {
    RegexCache cache(2);
    cache.get("a", "");
    cache.get("b", "");
    cache.get("a", "");  // "b" is now the oldest
    cache.get("c", "");

    REQUIRE(cache.size() == 2);
    REQUIRE(cache.contains("a", ""));
    REQUIRE_FALSE(cache.contains("b", ""));
    REQUIRE(cache.contains("c", ""));

    cache.clear();
    REQUIRE(cache.size() == 0);
}

TEST_CASE("RegexCache with zero capacity does not cache", "[regex]") {
    RegexCache cache(0);
    auto r = cache.get("x", "");
    REQUIRE(r != nullptr);
    REQUIRE(cache.size() == 0);
}

TEST_CASE("RegexCache flags", "[regex]") {
    RegexCache cache;

    SECTION("g, y and u are accepted") { REQUIRE_NOTHROW(cache.get("x", "gyu")); }

    SECTION("m anchors at line breaks") {
        auto r = cache.get("^b$", "m");
        REQUIRE(std::regex_search("a\nb\nc", *r));
    }

    SECTION("unknown or repeated flags are rejected") {
        REQUIRE_THROWS_AS(cache.get("x", "s"), std::invalid_argument);
        REQUIRE_THROWS_AS(cache.get("x", "ii"), std::invalid_argument);
        REQUIRE(cache.size() == 0);
    }

    SECTION("malformed patterns are not cached") {
        REQUIRE_THROWS_AS(cache.get("(", ""), std::regex_error);
        REQUIRE(cache.size() == 0);
    }
}
