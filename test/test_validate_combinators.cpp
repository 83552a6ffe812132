#include <catch2/catch_all.hpp>
#include <string>
#include "sg/schemaguard.h"

using namespace sg;

static std::string error_of(const Dictionary& value, const Dictionary& schema) {
    auto err = validate(value, schema);
    return err.has_value() ? std::string(err->what()) : std::string();
}

TEST_CASE("if/then/else picks a branch", "[validate][combinators]") {
    auto schema = parse_json(R"({
        "if": {"type": "number"},
        "then": {"minimum": 10},
        "else": {"type": "string", "maxLength": 3}
    })");

    REQUIRE(!validate(Dictionary(12), schema).has_value());
    REQUIRE(error_of(Dictionary(3), schema) == "Number is less than 10");
    REQUIRE(!validate(Dictionary(std::string("abc")), schema).has_value());
    REQUIRE(error_of(Dictionary(std::string("abcd")), schema) == "String length too long");
    REQUIRE(error_of(Dictionary(true), schema) == "Value type boolean does not match schema type string");

    SECTION("a missing branch is satisfied") {
        auto only_then = parse_json(R"({"if": {"type": "number"}, "then": {"minimum": 10}})");
        REQUIRE(!validate(Dictionary(std::string("x")), only_then).has_value());
    }

    SECTION("the failing branch shows in the schema location") {
        auto err = validate(Dictionary(3), schema);
        REQUIRE(err.has_value());
        REQUIRE(err->schemaLocation() == "root/then");
    }
}

TEST_CASE("allOf requires every schema", "[validate][combinators]") {
    auto schema = parse_json(R"({"allOf": [{"type": "number"}, {"minimum": 0}, {"maximum": 5}]})");
    REQUIRE(!validate(Dictionary(3), schema).has_value());
    REQUIRE(error_of(Dictionary(7), schema) == "Number is greater than 5");

    auto err = validate(Dictionary(-1), schema);
    REQUIRE(err.has_value());
    REQUIRE(err->schemaLocation() == "root/allOf/1");
}

TEST_CASE("anyOf requires at least one schema", "[validate][combinators]") {
    auto schema = parse_json(R"({"anyOf": [{"type": "string"}, {"type": "number", "minimum": 0}]})");
    REQUIRE(!validate(Dictionary(std::string("x")), schema).has_value());
    REQUIRE(!validate(Dictionary(4), schema).has_value());
    REQUIRE(error_of(Dictionary(-4), schema) == "0 anyOf schemas matched");
    REQUIRE(error_of(Dictionary::null(), schema) == "0 anyOf schemas matched");
}

TEST_CASE("oneOf requires exactly one schema", "[validate][combinators]") {
    auto schema = parse_json(R"({"oneOf": [{"type": "number"}, {"minimum": 0}]})");

    SECTION("two matches") { REQUIRE(error_of(Dictionary(5), schema) == "2 oneOf schemas matched"); }

    SECTION("one match") {
        REQUIRE(!validate(Dictionary(-5), schema).has_value());
        // minimum does not constrain strings
        REQUIRE(!validate(Dictionary(std::string("x")), schema).has_value());
    }

    SECTION("no matches") {
        auto strict = parse_json(R"({"oneOf": [{"type": "string"}, {"type": "boolean"}]})");
        REQUIRE(error_of(Dictionary(1), strict) == "0 oneOf schemas matched");
    }
}

TEST_CASE("not holds a list of forbidden schemas", "[validate][combinators]") {
    auto schema = parse_json(R"({"not": [{"type": "string"}, {"type": "number", "maximum": 0}]})");
    REQUIRE(!validate(Dictionary(true), schema).has_value());
    REQUIRE(!validate(Dictionary(3), schema).has_value());
    REQUIRE(error_of(Dictionary(std::string("x")), schema) == "not[0] schema matched");
    REQUIRE(error_of(Dictionary(-3), schema) == "not[1] schema matched");

    SECTION("a single schema object is ignored") {
        auto single = parse_json(R"({"not": {"type": "string"}})");
        REQUIRE(!validate(Dictionary(std::string("x")), single).has_value());
    }
}

TEST_CASE("keyword groups run in order", "[validate][combinators]") {
    // The type check runs before any combinator.
    auto schema = parse_json(R"({"type": "string", "anyOf": [{"type": "number"}]})");
    REQUIRE(error_of(Dictionary(1), schema) == "Value type number does not match schema type string");
    REQUIRE(error_of(Dictionary(std::string("x")), schema) == "0 anyOf schemas matched");

    // allOf failures are reported before anyOf.
    auto ordered = parse_json(R"({"allOf": [{"minimum": 10}], "anyOf": [{"type": "string"}]})");
    REQUIRE(error_of(Dictionary(1), ordered) == "Number is less than 10");
}

TEST_CASE("combinators nest inside properties", "[validate][combinators]") {
    auto schema = parse_json(R"({
        "type": "object",
        "properties": {
            "mode": {"oneOf": [{"const": "fast"}, {"const": "safe"}]},
            "level": {"allOf": [{"type": "integer"}, {"not": [{"const": 13}]}]}
        }
    })");

    REQUIRE(!validate(parse_json(R"({"mode": "fast", "level": 3})"), schema).has_value());

    auto err = validate(parse_json(R"({"mode": "slow"})"), schema);
    REQUIRE(err.has_value());
    REQUIRE(std::string(err->what()) == "0 oneOf schemas matched");
    REQUIRE(err->path() == "root/mode");

    err = validate(parse_json(R"({"level": 13})"), schema);
    REQUIRE(err.has_value());
    REQUIRE(std::string(err->what()) == "not[0] schema matched");
    REQUIRE(err->schemaLocation() == "root/properties/level/allOf/1/not/0");
}

TEST_CASE("errors reaching the caller carry the value and schema", "[validate][combinators]") {
    SECTION("anyOf") {
        auto schema = parse_json(R"({"anyOf": [{"type": "string"}, {"type": "boolean"}]})");
        auto err = validate(Dictionary(3), schema);
        REQUIRE(err.has_value());
        REQUIRE(err->value == Dictionary(3));
        REQUIRE(err->schema == schema);
    }

    SECTION("a branch after a failed if test") {
        auto schema = parse_json(R"({"if": {"type": "string"}, "else": {"minimum": 10}})");
        auto err = validate(Dictionary(3), schema);
        REQUIRE(err.has_value());
        REQUIRE(std::string(err->what()) == "Number is less than 10");
        REQUIRE(err->value == Dictionary(3));
        REQUIRE(err->schema == schema.at("else"));
        REQUIRE(err->path() == "root");
    }

    SECTION("a property after a failed oneOf sibling check") {
        auto schema = parse_json(R"({
            "type": "object",
            "properties": {
                "a": {"oneOf": [{"type": "string"}, {"type": "number"}]},
                "b": {"type": "string"}
            }
        })");
        auto err = validate(parse_json(R"({"a": 1, "b": 2})"), schema);
        REQUIRE(err.has_value());
        REQUIRE(err->value == Dictionary(2));
        REQUIRE(err->schema == schema.at("properties").at("b"));
    }
}
