#include <catch2/catch_all.hpp>
#include "sg/schemaguard.h"

using namespace sg;

TEST_CASE("getValidValueOrDefault: scalars", "[defaults]") {
    SECTION("a conforming value is kept") {
        auto schema = parse_json(R"({"type": "number", "default": 3})");
        REQUIRE(getValidValueOrDefault(schema, Dictionary(7)) == Dictionary(7));
    }

    SECTION("a mismatched value takes the default") {
        auto schema = parse_json(R"({"type": "number", "default": 3})");
        REQUIRE(getValidValueOrDefault(schema, Dictionary(std::string("x"))) == Dictionary(3));
    }

    SECTION("a default of the wrong type falls back to the empty value") {
        auto schema = parse_json(R"({"type": "string", "default": 5})");
        REQUIRE(getValidValueOrDefault(schema, Dictionary::null()) == Dictionary(std::string()));
    }

    SECTION("empty values per type") {
        REQUIRE(getValidValueOrDefault(parse_json(R"({"type": "boolean"})"), Dictionary::null()) == Dictionary(false));
        REQUIRE(getValidValueOrDefault(parse_json(R"({"type": "integer"})"), Dictionary(1.5)) == Dictionary(0));
        REQUIRE(getValidValueOrDefault(parse_json(R"({"type": "array"})"), Dictionary(1)).isArrayObject());
        REQUIRE(getValidValueOrDefault(parse_json(R"({"type": "object"})"), Dictionary(1)).isMappedObject());
        REQUIRE(getValidValueOrDefault(parse_json(R"({"type": "null"})"), Dictionary(1)).isNull());
    }

    SECTION("a list of types falls back to null") {
        auto schema = parse_json(R"({"type": ["string", "boolean"]})");
        REQUIRE(getValidValueOrDefault(schema, Dictionary(1)).isNull());
    }

    SECTION("no type keeps anything") {
        REQUIRE(getValidValueOrDefault(parse_json("{}"), Dictionary(1)) == Dictionary(1));
    }
}

TEST_CASE("getValidValueOrDefault: objects", "[defaults]") {
    auto schema = parse_json(R"({
        "type": "object",
        "properties": {
            "count": {"type": "integer", "minimum": 0, "default": 0},
            "name": {"type": "string"},
            "tags": {"type": "array", "items": {"type": "string"}}
        },
        "required": ["count", "tags"],
        "additionalProperties": false
    })");

    SECTION("required properties are inserted") {
        auto out = getValidValueOrDefault(schema, parse_json("{}"));
        REQUIRE(out == parse_json(R"({"count": 0, "tags": []})"));
        REQUIRE(!validate(out, schema).has_value());
    }

    SECTION("unsupported properties are dropped and mismatches repaired") {
        auto input = parse_json(R"({"extra": 1, "name": 5, "count": 4, "tags": ["a", 2]})");
        auto out = getValidValueOrDefault(schema, input);
        REQUIRE(out == parse_json(R"({"count": 4, "name": "", "tags": ["a", ""]})"));
        REQUIRE(!validate(out, schema).has_value());

        // the input is untouched
        REQUIRE(input.has("extra"));
        REQUIRE(input.at("name") == Dictionary(5));
    }

    SECTION("a non-object is replaced and populated") {
        auto out = getValidValueOrDefault(schema, Dictionary(std::string("nope")));
        REQUIRE(out == parse_json(R"({"count": 0, "tags": []})"));
    }

    SECTION("applying twice changes nothing") {
        auto once = getValidValueOrDefault(schema, parse_json(R"({"name": "x", "other": true})"));
        auto twice = getValidValueOrDefault(schema, once);
        REQUIRE(once == twice);
    }
}

TEST_CASE("getValidValueOrDefault: nested objects", "[defaults]") {
    auto schema = parse_json(R"({
        "type": "object",
        "properties": {
            "general": {
                "type": "object",
                "properties": {"theme": {"type": "string", "default": "light"}},
                "required": ["theme"]
            }
        },
        "required": ["general"]
    })");

    auto out = getValidValueOrDefault(schema, parse_json("{}"));
    REQUIRE(out == parse_json(R"({"general": {"theme": "light"}})"));
    REQUIRE(!validate(out, schema).has_value());
}

TEST_CASE("getValidValueOrDefault: required names without a schema are skipped", "[defaults]") {
    auto schema = parse_json(R"({"type": "object", "required": ["x"], "additionalProperties": false})");
    auto out = getValidValueOrDefault(schema, parse_json(R"({"y": 1})"));
    REQUIRE(out == parse_json("{}"));
}

TEST_CASE("getValidValueOrDefault: arrays", "[defaults]") {
    SECTION("every item is repaired") {
        auto schema = parse_json(R"({"type": "array", "items": {"type": "number", "default": 1}})");
        auto out = getValidValueOrDefault(schema, parse_json(R"([2, "x", null])"));
        REQUIRE(out == parse_json("[2, 1, 1]"));
    }

    SECTION("items past a closed tuple are left alone") {
        auto schema = parse_json(R"({"type": "array", "items": [{"type": "string"}], "additionalItems": false})");
        auto out = getValidValueOrDefault(schema, parse_json(R"([1, 2])"));
        REQUIRE(out == parse_json(R"(["", 2])"));
    }
}
