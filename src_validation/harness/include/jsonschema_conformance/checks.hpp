#pragma once

#include "backend.hpp"
#include "collection.hpp"
#include "result_log.hpp"

#include <string_view>

namespace jsonschema::conformance {

inline constexpr std::string_view kSchemaHardErrorPrefix = "NON SCHEMA EXCEPTION: ";
inline constexpr std::string_view kDataHardErrorPrefix = "NON DATA EXCEPTION: ";

/// A group that declares tests (even none) must compile; otherwise its `valid` decides.
[[nodiscard]] bool expected_schema_validity(const TestGroup& group) noexcept;

/**
 * \brief Checks that the engine accepts or rejects the group's schema as declared.
 *
 * The schema is compiled for the collection's version and exercised with an empty
 * string placeholder. A validation failure still proves the schema compiled. A
 * schema error means rejection. Any other exception appends a single hard-error
 * record and no comparison record.
 */
void check_schema(const Backend& backend, const Collection& collection,
                  const TestGroup& group, ResultLog& log);

/**
 * \brief Runs one test case through a freshly built schema and validator.
 *
 * When the case pins `expect`, the engine output must match it (see outputs_match)
 * or the case counts as rejected.
 */
void check_data(const Backend& backend, const Collection& collection,
                const TestGroup& group, const TestCase& test, ResultLog& log);

}  // namespace jsonschema::conformance
