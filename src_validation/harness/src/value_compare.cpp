#include "jsonschema_conformance/value_compare.hpp"

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

// Signed and unsigned storage of the same integer are one JSON type.
json::value_t normalized_type(const json& value) noexcept {
    const auto type = value.type();
    if (type == json::value_t::number_unsigned) {
        return json::value_t::number_integer;
    }
    return type;
}

}  // namespace

namespace jsonschema::conformance {

bool is_composite(const nlohmann::json& value) noexcept {
    return value.is_object() || value.is_array();
}

bool outputs_match(const nlohmann::json& produced, const nlohmann::json& expected) {
    if (is_composite(produced) && is_composite(expected)) {
        return produced == expected;
    }
    if (normalized_type(produced) != normalized_type(expected)) {
        return false;
    }
    return produced == expected;
}

}  // namespace jsonschema::conformance
