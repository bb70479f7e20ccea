#include "jsonschema_conformance/checks.hpp"

#include "jsonschema_conformance/mode_flags.hpp"
#include "jsonschema_conformance/value_compare.hpp"

#include <exception>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace jsonschema::conformance {

namespace {

LogRecord make_record(bool valid, const Collection& collection, const TestGroup& group,
                      const TestCase* test, CheckKind kind) {
    LogRecord record;
    record.valid = valid;
    record.file = collection.file_path;
    record.group_description = group.description;
    if (test != nullptr) {
        record.case_description = test->description;
    }
    record.kind = kind;
    record.flavor = valid ? FailureFlavor::None : FailureFlavor::Mismatch;
    return record;
}

LogRecord make_hard_error(const Collection& collection, const TestGroup& group,
                          const TestCase* test, CheckKind kind, std::string_view prefix,
                          const std::exception& ex) {
    auto record = make_record(false, collection, group, test, kind);
    record.flavor = FailureFlavor::HardError;
    record.error = std::string{prefix} + ex.what();
    return record;
}

}  // namespace

bool expected_schema_validity(const TestGroup& group) noexcept {
    if (group.cases) {
        return true;
    }
    return group.valid.value_or(false);
}

void check_schema(const Backend& backend, const Collection& collection,
                  const TestGroup& group, ResultLog& log) {
    const bool expected = expected_schema_validity(group);
    std::optional<std::string> engine_message;
    bool test_result = false;

    try {
        const auto schema = backend.make_schema(group.schema, collection.version);
        const auto validator = backend.make_validator(ModeFlag::None);
        (void)validator->validate(nlohmann::json(""), *schema);
        test_result = true;
    } catch (const ValidationError& ex) {
        engine_message = ex.what();
        test_result = true;
    } catch (const SchemaError& ex) {
        engine_message = ex.what();
        test_result = false;
    } catch (const std::exception& ex) {
        log.append(make_hard_error(collection, group, nullptr, CheckKind::Schema,
                                   kSchemaHardErrorPrefix, ex));
        return;
    }

    auto record = make_record(test_result == expected, collection, group, nullptr, CheckKind::Schema);
    record.error = std::move(engine_message);
    log.append(std::move(record));
}

void check_data(const Backend& backend, const Collection& collection,
                const TestGroup& group, const TestCase& test, ResultLog& log) {
    const ModeFlag modes = test.modes ? modes_from_names(*test.modes) : ModeFlag::None;

    nlohmann::json output;
    std::optional<std::string> engine_message;
    bool test_result = false;

    try {
        const auto schema = backend.make_schema(group.schema, collection.version);
        const auto validator = backend.make_validator(modes);
        output = validator->validate(test.data.value_or(nlohmann::json()), *schema);
        test_result = true;
    } catch (const ValidationError& ex) {
        engine_message = ex.what();
        test_result = false;
    } catch (const std::exception& ex) {
        log.append(make_hard_error(collection, group, &test, CheckKind::Data,
                                   kDataHardErrorPrefix, ex));
        return;
    }

    if (test.expect && !outputs_match(output, *test.expect)) {
        test_result = false;
    }

    auto record = make_record(test_result == test.valid, collection, group, &test, CheckKind::Data);
    record.error = std::move(engine_message);
    log.append(std::move(record));
}

}  // namespace jsonschema::conformance
