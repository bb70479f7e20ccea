#pragma once

#include "jsonschema_conformance/backend.hpp"
#include "jsonschema_conformance/mode_flags.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsonschema::conformance::json_schema_bridge
{

/**
 * Backend built on pboettch/json-schema-validator (nlohmann::json_schema).
 *
 * Schemas are compiled with json_validator::set_root_schema(); compile failures surface as
 * SchemaError. The bridge performs no network access: references to anything but the
 * bundled draft-07 meta-schema raise EngineError("External reference download problem ...").
 *
 * The validator library has no notion of casting or stripping, so the two mode flags are
 * implemented here as schema-guided instance transforms (see apply_modes) that run before
 * validation. The transformed instance is what validate() returns.
 */
class JsonSchemaBackend final : public Backend
{
public:
    struct Config
    {
        // Accepted collection version tags. An absent tag is always accepted.
        std::vector<std::string> supported_versions{"4", "6", "7"};

        // Enforce the `format` keyword through the library's default string format checker.
        bool check_formats{true};
    };

    JsonSchemaBackend();
    explicit JsonSchemaBackend(Config cfg);

    [[nodiscard]] std::unique_ptr<CompiledSchema> make_schema(
        const nlohmann::json& definition,
        const std::optional<std::string>& version) const override;

    [[nodiscard]] std::unique_ptr<Validator> make_validator(ModeFlag modes) const override;

private:
    Config cfg_;
};

/**
 * Applies the instance transforms selected by `modes` and returns the result.
 *
 *  - RemoveAdditionals: drops object members outside `properties`/`patternProperties` when
 *    `additionalProperties` is false, and tuple overflow when `additionalItems` is false.
 *  - Cast: converts strings to integer/number/boolean when the declared `type` permits and the
 *    whole string parses, integral floats to integers for integer-only schemas, and numbers or
 *    booleans to strings for string-only schemas.
 *
 * Both descend through properties, patternProperties, additionalProperties, items and
 * additionalItems. Stripping runs before casting.
 */
[[nodiscard]] nlohmann::json apply_modes(const nlohmann::json& schema,
                                         nlohmann::json instance,
                                         ModeFlag modes);

} // namespace jsonschema::conformance::json_schema_bridge
