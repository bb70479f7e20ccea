/**
 * @file test_data_check.cpp
 * @brief Data-level conformance: modes, outcome mapping and expected-output comparison
 */

#include <catch2/catch_test_macros.hpp>

#include "jsonschema_conformance/checks.hpp"
#include "test_support.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using jsonschema::conformance::CheckKind;
using jsonschema::conformance::EngineError;
using jsonschema::conformance::FailureFlavor;
using jsonschema::conformance::ModeFlag;
using jsonschema::conformance::ResultLog;
using jsonschema::conformance::SchemaError;
using jsonschema::conformance::TestCase;
using jsonschema::conformance::TestGroup;
using jsonschema::conformance::ValidationError;
using jsonschema::conformance::check_data;
using nlohmann::json;
using test_support::FakeBackend;
using test_support::make_collection;

namespace {

TestGroup group_for(json schema) {
    TestGroup g;
    g.description = "integer";
    g.schema = std::move(schema);
    g.cases = std::vector<TestCase>{};
    return g;
}

TestCase make_case(std::string description, std::optional<json> data, bool valid) {
    TestCase t;
    t.description = std::move(description);
    t.data = std::move(data);
    t.valid = valid;
    return t;
}

// Accepts integers, casts numeric strings under CAST, rejects everything else.
json integer_engine(const json& instance, const json&, ModeFlag modes) {
    if (instance.is_number_integer()) {
        return instance;
    }
    if (has_flag(modes, ModeFlag::Cast) && instance.is_string()) {
        return std::stoi(instance.get<std::string>());
    }
    throw ValidationError("Invalid type");
}

} // namespace

TEST_CASE("Modes are translated per case and each case gets its own validator", "[data][modes]") {
    FakeBackend backend;
    const auto collection = make_collection({});
    const auto group = group_for({{"type", "integer"}});

    auto plain = make_case("plain", json(1), true);
    auto cast = make_case("cast", json("1"), true);
    cast.modes = std::vector<std::string>{"CAST"};
    auto both = make_case("both", json::object(), true);
    both.modes = std::vector<std::string>{"REMOVE_ADDITIONALS", "CAST", "UNKNOWN"};

    ResultLog log;
    check_data(backend, collection, group, plain, log);
    check_data(backend, collection, group, cast, log);
    check_data(backend, collection, group, both, log);

    const auto modes = backend.requested_modes();
    REQUIRE(modes.size() == 3);
    REQUIRE(modes[0] == ModeFlag::None);
    REQUIRE(modes[1] == ModeFlag::Cast);
    REQUIRE(modes[2] == (ModeFlag::Cast | ModeFlag::RemoveAdditionals));
    REQUIRE(backend.requested_versions().size() == 3);
    REQUIRE(log.size() == 3);
}

TEST_CASE("Absent data is validated as null", "[data]") {
    FakeBackend backend;
    json seen = "unset";
    backend.on_validate = [&](const json& instance, const json&, ModeFlag) {
        seen = instance;
        return instance;
    };
    ResultLog log;
    check_data(backend, make_collection({}), group_for(json::object()),
               make_case("no data", std::nullopt, true), log);
    REQUIRE(seen.is_null());
    REQUIRE(log.records()[0].valid);
}

TEST_CASE("Verdict comparison against the fixture", "[data]") {
    FakeBackend backend;
    backend.on_validate = integer_engine;
    const auto collection = make_collection({});
    const auto group = group_for({{"type", "integer"}});

    SECTION("accepted and expected valid") {
        ResultLog log;
        check_data(backend, collection, group, make_case("int", json(3), true), log);
        REQUIRE(log.records()[0].valid);
        REQUIRE(log.records()[0].kind == CheckKind::Data);
        REQUIRE(log.records()[0].case_description == std::string("int"));
    }
    SECTION("rejected and expected invalid") {
        ResultLog log;
        check_data(backend, collection, group, make_case("string", json("x"), false), log);
        REQUIRE(log.records()[0].valid);
        REQUIRE(log.records()[0].error == std::string("Invalid type"));
    }
    SECTION("rejected but expected valid") {
        ResultLog log;
        check_data(backend, collection, group, make_case("string", json("x"), true), log);
        REQUIRE_FALSE(log.records()[0].valid);
        REQUIRE(log.records()[0].flavor == FailureFlavor::Mismatch);
        REQUIRE(log.records()[0].message() == "draft7/type.json | integer | string | Invalid type");
    }
}

TEST_CASE("Expected output must match the transformed instance", "[data][expect]") {
    FakeBackend backend;
    backend.on_validate = integer_engine;
    const auto collection = make_collection({});
    const auto group = group_for({{"type", "integer"}});

    SECTION("cast output matches") {
        auto t = make_case("cast", json("5"), true);
        t.modes = std::vector<std::string>{"CAST"};
        t.expect = json(5);
        ResultLog log;
        check_data(backend, collection, group, t, log);
        REQUIRE(log.records()[0].valid);
    }
    SECTION("scalar type mismatch fails an accepted case") {
        auto t = make_case("no cast", json(5), true);
        t.expect = json("5");
        ResultLog log;
        check_data(backend, collection, group, t, log);
        REQUIRE_FALSE(log.records()[0].valid);
    }
    SECTION("a mismatch turns an unexpected pass into the expected failure") {
        auto t = make_case("pinned", json(5), false);
        t.expect = json(6);
        ResultLog log;
        check_data(backend, collection, group, t, log);
        REQUIRE(log.records()[0].valid);
    }
    SECTION("rejected instances produce null output") {
        auto t = make_case("rejected", json("x"), false);
        t.expect = json(nullptr);
        ResultLog log;
        check_data(backend, collection, group, t, log);
        REQUIRE(log.records()[0].valid);
    }
}

TEST_CASE("Composite expected output ignores key order but not item order", "[data][expect]") {
    FakeBackend backend;
    backend.on_validate = [](const json& instance, const json&, ModeFlag) { return instance; };
    const auto collection = make_collection({});
    const auto group = group_for({{"type", "object"}});

    auto obj = make_case("object", json::parse(R"({"b":2,"a":1})"), true);
    obj.expect = json::parse(R"({"a":1,"b":2})");
    auto arr = make_case("array", json::parse("[2,1]"), true);
    arr.expect = json::parse("[1,2]");

    ResultLog log;
    check_data(backend, collection, group, obj, log);
    check_data(backend, collection, group, arr, log);
    REQUIRE(log.records()[0].valid);
    REQUIRE_FALSE(log.records()[1].valid);
}

TEST_CASE("Unexpected engine failures become hard errors without a comparison", "[data][hard]") {
    FakeBackend backend;
    const auto collection = make_collection({});
    const auto group = group_for(json::object());

    SECTION("engine error during validation") {
        backend.on_validate = [](const json&, const json&, ModeFlag) -> json {
            throw EngineError("External reference download problem");
        };
        ResultLog log;
        check_data(backend, collection, group, make_case("remote", json(1), false), log);
        REQUIRE(log.size() == 1);
        REQUIRE_FALSE(log.records()[0].valid);
        REQUIRE(log.records()[0].flavor == FailureFlavor::HardError);
        REQUIRE(log.records()[0].error ==
                std::string("NON DATA EXCEPTION: External reference download problem"));
    }
    SECTION("schema error is not a data verdict") {
        backend.on_schema = [](const json&, const std::optional<std::string>&) {
            throw SchemaError("bad schema");
        };
        ResultLog log;
        check_data(backend, collection, group, make_case("case", json(1), false), log);
        REQUIRE(log.records()[0].flavor == FailureFlavor::HardError);
        REQUIRE(log.records()[0].error == std::string("NON DATA EXCEPTION: bad schema"));
    }
}
