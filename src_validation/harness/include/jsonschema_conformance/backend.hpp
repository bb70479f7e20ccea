#pragma once

#include "mode_flags.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace jsonschema::conformance {

/// The engine rejected a schema definition as structurally invalid.
class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The engine rejected an instance against a schema.
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Anything else the engine could not do (unresolved reference, unreachable resource, ...).
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * \brief A schema definition compiled by a backend for one dialect version.
 */
class CompiledSchema {
public:
    virtual ~CompiledSchema() = default;
};

/**
 * \brief Validates instances against compiled schemas under a fixed mode set.
 */
class Validator {
public:
    virtual ~Validator() = default;

    /**
     * Returns the (possibly transformed) instance.
     *
     * Throws ValidationError on semantic rejection; any other exception denotes an
     * engine-internal failure.
     */
    virtual nlohmann::json validate(const nlohmann::json& instance,
                                    const CompiledSchema& schema) const = 0;
};

/**
 * \brief Boundary to the external JSON Schema validation engine.
 *
 * Implementations must be safe to call from several threads at once; every object
 * they hand out is owned by exactly one check.
 */
class Backend {
public:
    virtual ~Backend() = default;

    /// Throws SchemaError when the definition is malformed.
    [[nodiscard]] virtual std::unique_ptr<CompiledSchema> make_schema(
        const nlohmann::json& definition,
        const std::optional<std::string>& version) const = 0;

    [[nodiscard]] virtual std::unique_ptr<Validator> make_validator(ModeFlag modes) const = 0;
};

}  // namespace jsonschema::conformance
