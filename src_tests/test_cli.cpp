/**
 * @file test_cli.cpp
 * @brief Command-line parsing, default suites and exit codes of the conformance CLI
 */

#include <catch2/catch_test_macros.hpp>

#include "jsonschema_conformance/cli.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using jsonschema::conformance::OutputStyle;
using jsonschema::conformance::cli::Defaults;
using jsonschema::conformance::cli::parse_args;
using jsonschema::conformance::cli::parse_collection;
using jsonschema::conformance::cli::parse_jobs;
using jsonschema::conformance::cli::run_main;
using test_support::TempDir;

namespace {

const char* kPassingFixture = R"([
    {
        "description": "integer type",
        "schema": {"type": "integer"},
        "tests": [{"description": "an integer", "data": 1, "valid": true}]
    }
])";

const char* kFailingFixture = R"([
    {
        "description": "integer type",
        "schema": {"type": "integer"},
        "tests": [{"description": "a string", "data": "x", "valid": true}]
    }
])";

struct CliRun {
    int code{0};
    std::string out;
    std::string err;
};

CliRun invoke(const std::vector<std::string>& tokens, const Defaults& defaults = {}) {
    std::ostringstream out;
    std::ostringstream err;
    CliRun run;
    run.code = run_main(tokens, "jsonschema_conformance_cli", out, err, defaults);
    run.out = out.str();
    run.err = err.str();
    return run;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Collection arguments split off a trailing version tag", "[cli][args]") {
    SECTION("tagged") {
        const auto arg = parse_collection("suites/draft7=7");
        REQUIRE(arg.directory.string() == "suites/draft7");
        REQUIRE(arg.version == std::string("7"));
    }
    SECTION("empty tag") {
        const auto arg = parse_collection("suites/draft7=");
        REQUIRE(arg.directory.string() == "suites/draft7");
        REQUIRE_FALSE(arg.version.has_value());
    }
    SECTION("untagged") {
        const auto arg = parse_collection("suites/draft7");
        REQUIRE(arg.directory.string() == "suites/draft7");
        REQUIRE_FALSE(arg.version.has_value());
    }
    SECTION("equals sign inside the path") {
        const auto arg = parse_collection("a=b/dir");
        REQUIRE(arg.directory.string() == "a=b/dir");
        REQUIRE_FALSE(arg.version.has_value());
    }
    SECTION("equals sign inside a tagged path") {
        const auto arg = parse_collection("runs/x=y/suite=6");
        REQUIRE(arg.directory.string() == "runs/x=y/suite");
        REQUIRE(arg.version == std::string("6"));
    }
}

TEST_CASE("Job counts must be positive integers", "[cli][args]") {
    REQUIRE(parse_jobs("4") == 4);
    REQUIRE_THROWS_AS(parse_jobs("0"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_jobs("-1"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_jobs("2x"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_jobs("many"), std::runtime_error);
}

TEST_CASE("Options are parsed in order", "[cli][args]") {
    const auto args = parse_args({"--collection", "a=7", "b", "--ignore", "p1", "--ignore", "p2",
                                  "--ignore-file", "list.txt", "--format", "html", "--summary",
                                  "out/s.json", "--html", "out/r.html", "--jobs", "3", "--verbose"});
    REQUIRE(args.collections.size() == 2);
    REQUIRE(args.collections[0].version == std::string("7"));
    REQUIRE(args.collections[1].directory.string() == "b");
    REQUIRE(args.ignores == std::vector<std::string>{"p1", "p2"});
    REQUIRE(args.ignore_files.size() == 1);
    REQUIRE(args.style == OutputStyle::Html);
    REQUIRE(args.summary_path.string() == "out/s.json");
    REQUIRE(args.html_path.string() == "out/r.html");
    REQUIRE(args.jobs == 3);
    REQUIRE(args.verbose);
    REQUIRE_FALSE(args.help);
}

TEST_CASE("Malformed options are rejected", "[cli][args]") {
    REQUIRE_THROWS_AS(parse_args({"--collection"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse_args({"x", "--jobs", "0"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse_args({"x", "--format", "xml"}), std::invalid_argument);
}

TEST_CASE("Without collections the shipped suites and ignore list are used", "[cli][args][defaults]") {
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "suites" / "draft7");
    std::filesystem::create_directories(dir.path() / "suites" / "draft6");
    const auto ignore = dir.write("ignore.txt", "# none\n");
    const Defaults defaults{dir.path() / "suites", ignore};

    SECTION("both drafts with their versions") {
        const auto args = parse_args({}, defaults);
        REQUIRE(args.collections.size() == 2);
        REQUIRE(args.collections[0].directory.string() == (dir.path() / "suites" / "draft7").string());
        REQUIRE(args.collections[0].version == std::string("7"));
        REQUIRE(args.collections[1].version == std::string("6"));
        REQUIRE(args.ignore_files.size() == 1);
        REQUIRE(args.ignore_files[0].string() == ignore.string());
    }
    SECTION("an explicit ignore file replaces the default") {
        const auto args = parse_args({"--ignore-file", "mine.txt"}, defaults);
        REQUIRE(args.ignore_files.size() == 1);
        REQUIRE(args.ignore_files[0].string() == "mine.txt");
    }
    SECTION("explicit collections disable the fallback") {
        const auto args = parse_args({"--collection", "elsewhere"}, defaults);
        REQUIRE(args.collections.size() == 1);
        REQUIRE(args.ignore_files.empty());
    }
    SECTION("no suites at all") {
        const Defaults empty{dir.path() / "missing", ignore};
        REQUIRE_THROWS_AS(parse_args({}, empty), std::runtime_error);
    }
}

TEST_CASE("Help exits cleanly without running", "[cli][exit]") {
    const auto run = invoke({"--help"});
    REQUIRE(run.code == 0);
    REQUIRE(run.out.empty());
    REQUIRE(contains(run.err, "Usage:"));
}

TEST_CASE("Exit code reflects counted failures", "[cli][exit]") {
    TempDir dir;
    dir.write("pass/type.json", kPassingFixture);
    dir.write("fail/type.json", kFailingFixture);

    SECTION("all checks pass") {
        const auto run = invoke({"--collection", (dir.path() / "pass").string() + "=7", "--format", "plain"});
        REQUIRE(run.code == 0);
        REQUIRE(contains(run.out, "Total Succeed: 2!"));
        REQUIRE(contains(run.out, "Total Fail: 0!"));
        REQUIRE(run.err.empty());
    }
    SECTION("a failing case") {
        const auto run = invoke({"--collection", (dir.path() / "fail").string() + "=7", "--format", "plain"});
        REQUIRE(run.code == 1);
        REQUIRE(contains(run.out, "integer type | a string"));
        REQUIRE(contains(run.out, "Total Fail: 1!"));
    }
    SECTION("the failure is ignored") {
        const auto run = invoke({"--collection", (dir.path() / "fail").string(), "--format", "plain",
                                 "--ignore", "integer type | a string"});
        REQUIRE(run.code == 0);
        REQUIRE(contains(run.out, "[ignored] "));
    }
}

TEST_CASE("Fixture and configuration errors exit with 2", "[cli][exit]") {
    TempDir dir;

    SECTION("malformed fixture") {
        dir.write("bad/type.json", "[{\"description\": ");
        const auto run = invoke({"--collection", (dir.path() / "bad").string()});
        REQUIRE(run.code == 2);
        REQUIRE(run.err.rfind("ERROR: ", 0) == 0);
        REQUIRE(run.out.empty());
    }
    SECTION("missing collection") {
        const auto run = invoke({"--collection", (dir.path() / "absent").string()});
        REQUIRE(run.code == 2);
        REQUIRE(run.err.rfind("ERROR: ", 0) == 0);
    }
    SECTION("bad option value prints usage") {
        const auto run = invoke({"--jobs", "zero"});
        REQUIRE(run.code == 2);
        REQUIRE(contains(run.err, "ERROR: --jobs expects a positive integer"));
        REQUIRE(contains(run.err, "Usage:"));
    }
}

TEST_CASE("Console report is printed before metrics files are written", "[cli][metrics]") {
    TempDir dir;
    dir.write("fail/type.json", kFailingFixture);
    const auto collection = (dir.path() / "fail").string();

    SECTION("unwritable summary still shows the results") {
        std::filesystem::create_directories(dir.path() / "occupied");
        const auto run = invoke({"--collection", collection, "--format", "plain",
                                 "--summary", (dir.path() / "occupied").string()});
        REQUIRE(run.code == 2);
        REQUIRE(contains(run.out, "integer type | a string"));
        REQUIRE(contains(run.out, "Total Fail: 1!"));
        REQUIRE(contains(run.err, "ERROR: "));
    }
    SECTION("summary and report are written") {
        const auto summary = dir.path() / "out" / "summary.json";
        const auto html = dir.path() / "out" / "report.html";
        const auto run = invoke({"--collection", collection, "--summary", summary.string(),
                                 "--html", html.string()});
        REQUIRE(run.code == 1);
        REQUIRE(std::filesystem::exists(summary));
        REQUIRE(std::filesystem::exists(html));
    }
}

TEST_CASE("Shipped suites pass with the shipped ignore list", "[cli][exit][suites]") {
    const std::filesystem::path root{JSONSCHEMA_CONFORMANCE_SOURCE_DIR};
    const Defaults defaults{root / "src_validation" / "resources" / "suites",
                            root / "src_validation" / "resources" / "ignore.txt"};
    const auto run = invoke({"--format", "plain", "--jobs", "2"}, defaults);
    REQUIRE(run.err.empty());
    REQUIRE(contains(run.out, "Total Fail: 0!"));
    REQUIRE(run.code == 0);
}
