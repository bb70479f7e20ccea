#include "jsonschema_conformance/cli.hpp"

#include "jsonschema_conformance/collection_loader.hpp"
#include "jsonschema_conformance/engine.hpp"
#include "jsonschema_conformance/json_schema_bridge.hpp"
#include "jsonschema_conformance/metrics_writer.hpp"

#include <exception>
#include <filesystem>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

const std::string& next_value(const std::vector<std::string>& tokens, std::size_t& i,
                              std::string_view option) {
    if (i + 1 >= tokens.size()) {
        throw std::runtime_error(std::string{option} + " expects a value");
    }
    return tokens[++i];
}

}  // namespace

namespace jsonschema::conformance::cli {

CollectionArg parse_collection(std::string_view raw) {
    CollectionArg arg;
    const auto eq = raw.rfind('=');
    if (eq == std::string_view::npos ||
        raw.find_first_of("/\\", eq + 1) != std::string_view::npos) {
        arg.directory = std::filesystem::path(std::string(raw));
        return arg;
    }
    arg.directory = std::filesystem::path(std::string(raw.substr(0, eq)));
    const auto version = raw.substr(eq + 1);
    if (!version.empty()) {
        arg.version = std::string(version);
    }
    return arg;
}

std::size_t parse_jobs(std::string_view raw) {
    std::size_t consumed = 0;
    const std::string text(raw);
    unsigned long value = 0;
    try {
        value = std::stoul(text, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("--jobs expects a positive integer, got '" + text + "'");
    }
    if (consumed != text.size() || value == 0 || text.front() == '-') {
        throw std::runtime_error("--jobs expects a positive integer, got '" + text + "'");
    }
    return static_cast<std::size_t>(value);
}

Args parse_args(const std::vector<std::string>& tokens, const Defaults& defaults) {
    Args args;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        std::string_view tok = tokens[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--collection")) {
            args.collections.push_back(parse_collection(next_value(tokens, i, tok)));
        } else if (arg_eq(tok, "--ignore")) {
            args.ignores.push_back(next_value(tokens, i, tok));
        } else if (arg_eq(tok, "--ignore-file")) {
            args.ignore_files.emplace_back(next_value(tokens, i, tok));
        } else if (arg_eq(tok, "--format")) {
            args.style = parse_output_style(next_value(tokens, i, tok));
        } else if (arg_eq(tok, "--summary")) {
            args.summary_path = std::filesystem::path(next_value(tokens, i, tok));
        } else if (arg_eq(tok, "--html")) {
            args.html_path = std::filesystem::path(next_value(tokens, i, tok));
        } else if (arg_eq(tok, "--jobs")) {
            args.jobs = parse_jobs(next_value(tokens, i, tok));
        } else if (arg_eq(tok, "--verbose")) {
            args.verbose = true;
        } else {
            // Treat as an untagged collection for convenience
            args.collections.push_back(parse_collection(tok));
        }
    }

    if (args.help) {
        return args;
    }

    if (args.collections.empty()) {
        // Fall back to the suites shipped with the repository.
        const auto draft7 = defaults.suites_root / "draft7";
        const auto draft6 = defaults.suites_root / "draft6";
        if (std::filesystem::is_directory(draft7)) {
            args.collections.push_back({draft7, std::string("7")});
        }
        if (std::filesystem::is_directory(draft6)) {
            args.collections.push_back({draft6, std::string("6")});
        }
        if (args.collections.empty()) {
            throw std::runtime_error("No collections specified and no suites found under " +
                                     defaults.suites_root.string());
        }

        if (args.ignore_files.empty() && std::filesystem::is_regular_file(defaults.ignore_file)) {
            args.ignore_files.push_back(defaults.ignore_file);
        }
    }

    return args;
}

void print_usage(std::ostream& out, std::string_view argv0) {
    out << "JSON Schema Conformance CLI\n"
        << "Usage:\n"
        << "  " << argv0 << " --collection <dir>[=<version>] [--collection ...]\n"
        << "                 [--ignore <pattern>] [--ignore-file <path>] [--format ansi|plain|html]\n"
        << "                 [--summary <path>] [--html <path>] [--jobs <n>] [--verbose]\n"
        << "\n"
        << "Options:\n"
        << "  --collection   Fixture directory (or file), optionally tagged with a schema version.\n"
        << "                 A suffix containing '/' is part of the path, not a version.\n"
        << "  --ignore       Substring of failure messages that must not fail the run.\n"
        << "  --ignore-file  File with one ignore pattern per line ('#' starts a comment).\n"
        << "  --format       Console rendering (default: ansi).\n"
        << "  --summary      Write JSON summary to this path.\n"
        << "  --html         Write HTML report to this path.\n"
        << "  --jobs         Worker threads (default: 1).\n"
        << "  --verbose      Also print passing checks.\n"
        << "  -h, --help     Show this help message.\n"
        << "\n"
        << "Default: Without --collection, runs src_validation/resources/suites/draft7 (version 7)\n"
        << "and src_validation/resources/suites/draft6 (version 6) with\n"
        << "src_validation/resources/ignore.txt as ignore list.\n"
        << std::endl;
}

int run(const Args& args, std::ostream& out) {
    json_schema_bridge::JsonSchemaBackend backend;
    Engine::Config config;
    config.jobs = args.jobs;
    config.verbose = args.verbose;
    config.loader.extension = ".json";
    Engine engine(backend, config);

    // Load every collection before running anything
    for (const auto& collection : args.collections) {
        engine.add_collection(collection.directory, collection.version);
    }
    for (const auto& file : args.ignore_files) {
        engine.ignore_file(file);
    }
    for (const auto& pattern : args.ignores) {
        engine.ignore(pattern);
    }

    const auto result = engine.run();

    Reporter reporter(args.style);
    reporter.render(result.report, out);

    // Emit artifacts
    MetricsWriter writer;
    if (!args.summary_path.empty()) {
        writer.write_summary(args.summary_path, result);
    }
    if (!args.html_path.empty()) {
        writer.write_detailed(args.html_path, result);
    }

    return exit_code(result.report);
}

int run_main(const std::vector<std::string>& tokens, std::string_view argv0,
             std::ostream& out, std::ostream& err, const Defaults& defaults) {
    try {
        const auto args = parse_args(tokens, defaults);
        if (args.help) {
            print_usage(err, argv0);
            return 0;
        }
        return run(args, out);
    } catch (const FixtureError& ex) {
        err << "ERROR: " << ex.what() << "\n";
        return 2; // fixture corpus unusable
    } catch (const std::exception& ex) {
        err << "ERROR: " << ex.what() << "\n";
        print_usage(err, argv0);
        return 2; // configuration/environment issue
    } catch (...) {
        err << "ERROR: Unknown exception\n";
        return 3; // internal error
    }
}

}  // namespace jsonschema::conformance::cli
