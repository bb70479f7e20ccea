#pragma once

#include "jsonschema_conformance/reporter.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonschema::conformance::cli {

struct CollectionArg {
    std::filesystem::path directory;
    std::optional<std::string> version;
};

struct Args {
    std::vector<CollectionArg> collections;
    std::vector<std::string> ignores;
    std::vector<std::filesystem::path> ignore_files;
    OutputStyle style{OutputStyle::Ansi};
    std::filesystem::path summary_path{};
    std::filesystem::path html_path{};
    std::size_t jobs{1};
    bool verbose{false};
    bool help{false};
};

/// Locations used when no `--collection` is given.
struct Defaults {
    std::filesystem::path suites_root{"src_validation/resources/suites"};
    std::filesystem::path ignore_file{"src_validation/resources/ignore.txt"};
};

/**
 * \brief Splits `<dir>[=<version>]`.
 *
 * Only the last `=` is considered, and only when the text after it contains no path
 * separator, so `a=b/dir` stays an untagged path. `dir=` yields no version.
 */
[[nodiscard]] CollectionArg parse_collection(std::string_view raw);

/// Throws std::runtime_error unless `raw` is a positive integer.
[[nodiscard]] std::size_t parse_jobs(std::string_view raw);

/**
 * \brief Parses the tokens following the program name.
 *
 * Without collections, falls back to `<suites_root>/draft7` (version 7) and
 * `<suites_root>/draft6` (version 6) when present, plus the default ignore list when
 * no `--ignore-file` was given. Throws std::runtime_error on bad input.
 */
[[nodiscard]] Args parse_args(const std::vector<std::string>& tokens, const Defaults& defaults = {});

void print_usage(std::ostream& out, std::string_view argv0);

/**
 * \brief Loads, runs, renders, then writes the requested metrics files.
 *
 * Returns the run's exit code. Exceptions propagate.
 */
int run(const Args& args, std::ostream& out);

/**
 * \brief Whole command line: parse, run and map errors to exit codes.
 *
 * 0 no counted failure, 1 failures, 2 configuration or fixture error (`ERROR:` on `err`),
 * 3 unknown internal error.
 */
int run_main(const std::vector<std::string>& tokens, std::string_view argv0,
             std::ostream& out, std::ostream& err, const Defaults& defaults = {});

}  // namespace jsonschema::conformance::cli
