#pragma once

#include "collection.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace jsonschema::conformance {

/**
 * \brief Raised when a fixture file or fixture root cannot be turned into a Collection.
 *
 * Fixture-load errors are fatal: a malformed corpus cannot produce meaningful results.
 */
class FixtureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * \brief Loads JSON fixture files from disk.
 *
 * Each file holds an array of test groups in the JSON-Schema-Test-Suite layout:
 *
 * \code{.json}
 * [
 *   {
 *     "description": "integer type",
 *     "schema": {"type": "integer"},
 *     "tests": [
 *       {"description": "cast string", "data": "5", "modes": ["CAST"], "valid": true, "expect": 5}
 *     ]
 *   },
 *   {"description": "bad schema", "schema": {"type": 12}, "valid": false}
 * ]
 * \endcode
 *
 * Recognised group keys are `description`, `schema`, `valid` and `tests`; recognised
 * case keys are `description`, `data`, `valid`, `expect` and `modes`. Other keys are
 * ignored. Structural violations raise FixtureError naming the file and JSON pointer.
 */
class CollectionLoader {
public:
    struct Options {
        /// When non-empty, directory walks only pick up files with this extension.
        std::string extension{};
    };

    CollectionLoader() = default;
    explicit CollectionLoader(Options options);

    [[nodiscard]] Collection load(const std::filesystem::path& file,
                                  const std::optional<std::string>& version) const;

    /// Walks `root` recursively in sorted path order. A regular file root yields one collection.
    [[nodiscard]] std::vector<Collection> load_directory(
        const std::filesystem::path& root,
        const std::optional<std::string>& version) const;

private:
    Options options_{};
};

}  // namespace jsonschema::conformance
