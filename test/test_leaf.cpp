#include <catch2/catch.hpp>
#include <sc/schemata.h>

using namespace sc;

TEST_CASE("unknown accepts anything unchanged", "[leaf][unknown]") {
    auto s = unknown();
    for (const Value& v : {Value("x"), Value(1), Value(2.5), Value(true), Value::null(), Value::absent(),
                           Value::array({1, "a"}), Value{{"k", "v"}}}) {
        auto r = s.safeParse(v);
        REQUIRE(r.ok());
        REQUIRE(r.value() == v);
    }
}

TEST_CASE("string accepts strings only", "[leaf][string]") {
    auto s = string();

    SECTION("strings pass through unchanged") {
        REQUIRE(s.parse("hello") == Value("hello"));
        REQUIRE(s.parse("") == Value(""));
    }

    SECTION("non-strings are a type mismatch") {
        for (const Value& v : {Value(1), Value(1.5), Value(false), Value::null(), Value::absent(),
                               Value::array({"a"}), Value{{"a", "b"}}}) {
            auto r = s.safeParse(v);
            REQUIRE_FALSE(r.ok());
            REQUIRE(r.error().kind == FailureKind::TypeMismatch);
            REQUIRE(r.error().message == "Not a string");
            REQUIRE(r.error().path.empty());
        }
    }
}

TEST_CASE("number accepts integers and doubles", "[leaf][number]") {
    auto s = number();

    REQUIRE(s.parse(42) == Value(42));
    REQUIRE(s.parse(-0.5) == Value(-0.5));

    for (const Value& v : {Value("1"), Value(true), Value::null(), Value::absent(), Value::array({1})}) {
        auto r = s.safeParse(v);
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.error().kind == FailureKind::TypeMismatch);
        REQUIRE(r.error().message == "Not a number");
    }
}

TEST_CASE("schema kinds", "[leaf]") {
    REQUIRE(unknown().kind() == SchemaKind::Unknown);
    REQUIRE(string().kind() == SchemaKind::String);
    REQUIRE(number().kind() == SchemaKind::Number);
    REQUIRE(string().minLength(1).kind() == SchemaKind::String);
    REQUIRE(to_string(SchemaKind::Intersection) == "intersection");
}

TEST_CASE("empty schemas are programming errors", "[leaf]") {
    Schema s;
    REQUIRE(s.empty());
    REQUIRE_THROWS_AS(s.safeParse(Value(1)), std::logic_error);
    REQUIRE_THROWS_AS(array(Schema()), std::invalid_argument);
    REQUIRE_THROWS_AS(optional(Schema()), std::invalid_argument);
}
