#include <catch2/catch.hpp>
#include <sc/schemata.h>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

using namespace sc;

namespace {

ObjectSchema config_schema() {
    auto portSpec = number().integer().minimum(1).maximum(65535);
    return object({{"name", string().nonEmpty()},
                   {"port", portSpec},
                   {"debug", unknown().optional()},
                   {"hosts", array(string()).optional()}});
}

}  // namespace

TEST_CASE("validate: valid and invalid cases", "[validate]") {
    auto schema = config_schema();

    SECTION("valid config") {
        Value cfg = {{"name", "example"}, {"port", 8080}, {"debug", true}};
        auto err = validate(cfg, schema);
        REQUIRE(!err.has_value());
    }

    SECTION("invalid: missing required") {
        Value cfg = {{"port", 80}};
        auto err = validate(cfg, schema);
        REQUIRE(err.has_value());
        REQUIRE(err.value() == "Not a string at 'name'");
    }

    SECTION("invalid: out of range") {
        Value cfg = {{"name", "example"}, {"port", 70000}};
        auto err = validate(cfg, schema);
        REQUIRE(err.has_value());
        REQUIRE(err.value() == "Number must be less than or equal to 65535 at 'port'");
    }

    SECTION("invalid: nested element") {
        Value cfg = {{"name", "example"}, {"port", 80}, {"hosts", {"a", "b"}}};
        REQUIRE(!validate(cfg, schema).has_value());
        cfg["hosts"] = Value::array({"a", 2});
        REQUIRE(validate(cfg, schema).value() == "Not a string at 'hosts/1'");
    }

    SECTION("invalid: root") {
        REQUIRE(validate(Value("config"), schema).value() == "Not an object");
    }
}

TEST_CASE("parse throws SchemaError", "[validate][parse]") {
    auto schema = config_schema();
    Value bad = {{"name", ""}, {"port", 80}};

    auto expected = schema.safeParse(bad);
    REQUIRE_FALSE(expected.ok());

    try {
        schema.parse(bad);
        FAIL("parse() accepted an invalid value");
    } catch (const SchemaError& e) {
        REQUIRE(e.failure() == expected.error());
        REQUIRE(e.kind() == FailureKind::ConstraintViolation);
        REQUIRE(std::string(e.what()) == "String must not be empty at 'name'");
    }

    Value good = {{"name", "n"}, {"port", 80}};
    REQUIRE(schema.parse(good) == good);
}

TEST_CASE("parse result accessors", "[validate][parse]") {
    auto ok = number().safeParse(1);
    REQUIRE(static_cast<bool>(ok));
    REQUIRE_THROWS_AS(ok.error(), std::logic_error);

    auto failed = number().safeParse("1");
    REQUIRE_FALSE(static_cast<bool>(failed));
    REQUIRE_THROWS_AS(failed.value(), std::logic_error);
    REQUIRE(to_string(failed.error().kind) == "TypeMismatch");
}

TEST_CASE("parse is idempotent", "[validate]") {
    auto schema = object({{"id", union_of({string(), number()})},
                          {"tags", array(string().minLength(1))},
                          {"meta", object({{"owner", string()}}).optional()},
                          {"both", intersection(unknown(), object({{"x", number()}})).optional()}});

    Value input = {{"id", 3},
                   {"tags", {"a", "bb"}},
                   {"meta", {{"owner", "me"}, {"ignored", 1}}},
                   {"both", {{"x", 1}, {"y", 2}}},
                   {"extra", "dropped"}};

    Value once = schema.parse(input);
    Value twice = schema.parse(once);
    REQUIRE(once == twice);
    REQUIRE_FALSE(once.has("extra"));
    REQUIRE_FALSE(once.at("meta").has("ignored"));
    // intersection output is the input itself
    REQUIRE(once.at("both").has("y"));
}

TEST_CASE("output type rendering", "[validate][type]") {
    REQUIRE(unknown().outputType() == "unknown");
    REQUIRE(string().minLength(2).outputType() == "string");
    REQUIRE(array(number()).outputType() == "Array<number>");
    REQUIRE(object({}).outputType() == "{}");
    REQUIRE(config_schema().outputType() ==
            "{ name: string; port: number; debug?: unknown; hosts?: Array<string> }");
    REQUIRE(string().optional().outputType() == "string | undefined");
    REQUIRE(string().unionWith(number()).outputType() == "string | number");
    REQUIRE(intersection(object({{"a", string()}}), string().unionWith(number())).outputType() ==
            "{ a: string } & (string | number)");
}

TEST_CASE("debug tracing does not change results", "[validate][debug]") {
    auto schema = config_schema();
    Value bad = {{"name", "n"}, {"port", "80"}};
    auto quiet = schema.safeParse(bad);

    setenv("SC_PARSE_DEBUG", "1", 1);
    auto traced = schema.safeParse(bad);
    unsetenv("SC_PARSE_DEBUG");

    REQUIRE(quiet.error() == traced.error());
}

TEST_CASE("debug tracing writes one line per visit and failure", "[validate][debug]") {
    auto schema = object({{"id", union_of({string(), number().integer()})}});

    std::ostringstream captured;
    auto* previous = std::cerr.rdbuf(captured.rdbuf());
    setenv("SC_PARSE_DEBUG", "1", 1);
    auto r = schema.safeParse(Value{{"id", 1.5}});
    unsetenv("SC_PARSE_DEBUG");
    std::cerr.rdbuf(previous);

    REQUIRE_FALSE(r.ok());
    const std::string trace = captured.str();
    REQUIRE(trace.find("parse enter: path='' kind=object value={\"id\":1.5}\n") != std::string::npos);
    REQUIRE(trace.find("parse enter: path='id' kind=union value=1.5\n") != std::string::npos);
    REQUIRE(trace.find("parse fail: path='id' kind=TypeMismatch message=Not a string\n") != std::string::npos);
    // the aggregated message stays on the record's own line
    REQUIRE(trace.find("parse fail: path='id' kind=NoMatchingVariant message=Not a string\\nNumber must be an "
                       "integer\n") != std::string::npos);
}

TEST_CASE("one schema validates from several threads", "[validate][threads]") {
    auto schema = config_schema();
    Value good = {{"name", "example"}, {"port", 8080}, {"hosts", {"a", "b"}}};
    Value bad = {{"name", "example"}, {"port", 70000}};
    const auto expected = schema.safeParse(bad).error();

    const int kThreads = 8;
    const int kRounds = 500;
    std::vector<int> wrong(kThreads, 0);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < kRounds; ++i) {
                auto ok = schema.safeParse(good);
                auto failed = schema.safeParse(bad);
                if (!ok.ok() || ok.value() != good) ++wrong[t];
                if (failed.ok() || failed.error() != expected) ++wrong[t];
            }
        });
    }
    for (auto& w : workers) w.join();

    for (int count : wrong) REQUIRE(count == 0);
}
