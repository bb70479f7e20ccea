#pragma once

#include <nlohmann/json.hpp>

namespace jsonschema::conformance {

/// Objects and arrays are composite; everything else is scalar.
[[nodiscard]] bool is_composite(const nlohmann::json& value) noexcept;

/**
 * \brief Compares an engine output with a fixture's `expect` value.
 *
 * Two composites compare by deep structural equality: object members match
 * regardless of key order, arrays must agree in length and order. Otherwise both
 * the value and its JSON type must match, so `1`, `1.0` and `"1"` are all distinct.
 */
[[nodiscard]] bool outputs_match(const nlohmann::json& produced, const nlohmann::json& expected);

}  // namespace jsonschema::conformance
