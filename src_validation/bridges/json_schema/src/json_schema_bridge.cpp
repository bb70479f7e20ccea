#include "jsonschema_conformance/json_schema_bridge.hpp"

#include <algorithm>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <nlohmann/json-schema.hpp>

namespace {

using jsonschema::conformance::CompiledSchema;
using jsonschema::conformance::EngineError;
using jsonschema::conformance::ModeFlag;
using jsonschema::conformance::SchemaError;
using jsonschema::conformance::ValidationError;
using nlohmann::json;
using nlohmann::json_schema::json_uri;
using nlohmann::json_schema::json_validator;

constexpr const char* kDraft7MetaSchema = "http://json-schema.org/draft-07/schema";

// Only the bundled meta-schema resolves; everything else would need a download.
void offline_loader(const json_uri& uri, json& schema) {
    if (uri.location() == kDraft7MetaSchema) {
        schema = nlohmann::json_schema::draft7_schema_builtin;
        return;
    }
    throw EngineError("External reference download problem: " + uri.to_string());
}

// Keeps the first reported error so it can be rethrown as ValidationError.
class FirstErrorHandler : public nlohmann::json_schema::basic_error_handler {
public:
    void error(const json::json_pointer& ptr, const json& instance,
               const std::string& message) override {
        nlohmann::json_schema::basic_error_handler::error(ptr, instance, message);
        if (message_.empty()) {
            message_ = "At '" + ptr.to_string() + "' of " + instance.dump() + " - " + message;
        }
    }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    std::string message_;
};

class BridgeSchema final : public CompiledSchema {
public:
    BridgeSchema(json definition, bool check_formats)
        : definition_{std::move(definition)},
          validator_{offline_loader,
                     check_formats ? nlohmann::json_schema::format_checker{
                                         nlohmann::json_schema::default_string_format_check}
                                   : nlohmann::json_schema::format_checker{}} {}

    void compile() {
        try {
            validator_.set_root_schema(definition_);
        } catch (const EngineError&) {
            throw;
        } catch (const std::invalid_argument& ex) {
            throw SchemaError(ex.what());
        } catch (const json::exception& ex) {
            throw SchemaError(ex.what());
        } catch (const std::regex_error& ex) {
            // pattern / patternProperties are compiled eagerly
            throw SchemaError(ex.what());
        }
    }

    [[nodiscard]] const json& definition() const noexcept { return definition_; }
    [[nodiscard]] const json_validator& validator() const noexcept { return validator_; }

private:
    json definition_;
    json_validator validator_;
};

class BridgeValidator final : public jsonschema::conformance::Validator {
public:
    explicit BridgeValidator(ModeFlag modes) : modes_{modes} {}

    json validate(const json& instance, const CompiledSchema& schema) const override {
        const auto* compiled = dynamic_cast<const BridgeSchema*>(&schema);
        if (compiled == nullptr) {
            throw EngineError("Schema was not compiled by the json-schema-validator bridge");
        }

        json transformed = jsonschema::conformance::json_schema_bridge::apply_modes(
            compiled->definition(), instance, modes_);

        FirstErrorHandler handler;
        (void)compiled->validator().validate(transformed, handler);
        if (handler) {
            throw ValidationError(handler.message());
        }
        return transformed;
    }

private:
    ModeFlag modes_;
};

}  // namespace

namespace jsonschema::conformance::json_schema_bridge
{

JsonSchemaBackend::JsonSchemaBackend() : JsonSchemaBackend(Config{}) {}

JsonSchemaBackend::JsonSchemaBackend(Config cfg) : cfg_{std::move(cfg)} {}

std::unique_ptr<CompiledSchema> JsonSchemaBackend::make_schema(
    const nlohmann::json& definition,
    const std::optional<std::string>& version) const
{
    if (version &&
        std::find(cfg_.supported_versions.begin(), cfg_.supported_versions.end(), *version) ==
            cfg_.supported_versions.end()) {
        throw EngineError("Unsupported schema version \"" + *version + "\"");
    }

    auto schema = std::make_unique<BridgeSchema>(definition, cfg_.check_formats);
    schema->compile();
    return schema;
}

std::unique_ptr<Validator> JsonSchemaBackend::make_validator(ModeFlag modes) const
{
    return std::make_unique<BridgeValidator>(modes);
}

} // namespace jsonschema::conformance::json_schema_bridge
