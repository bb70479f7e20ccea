#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsonschema::conformance {

/**
 * \brief One data instance checked against the enclosing group's schema.
 *
 * Presence is tracked explicitly: `data` absent is validated as null, while
 * `expect` absent skips the output comparison and `expect` holding null pins a
 * null output.
 */
struct TestCase {
    std::string description;
    std::optional<nlohmann::json> data;
    bool valid{false};
    std::optional<nlohmann::json> expect;
    std::optional<std::vector<std::string>> modes;
};

/**
 * \brief One schema under test together with its expected validity and cases.
 *
 * A group without `cases` only exercises schema compilation and therefore
 * always carries `valid`. An empty `cases` array still counts as present.
 */
struct TestGroup {
    std::string description;
    nlohmann::json schema;
    std::optional<bool> valid;
    std::optional<std::vector<TestCase>> cases;
};

/**
 * \brief Parsed content of one fixture file plus its schema-version tag.
 */
struct Collection {
    std::string file_path;
    std::optional<std::string> version;
    std::vector<TestGroup> groups;
};

}  // namespace jsonschema::conformance
