#include "jsonschema_conformance/collection_loader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using jsonschema::conformance::FixtureError;
using jsonschema::conformance::TestCase;
using jsonschema::conformance::TestGroup;
using nlohmann::json;

[[noreturn]] void fail(const std::filesystem::path& file, const std::string& pointer,
                       const std::string& what) {
    throw FixtureError("Invalid fixture " + file.string() + " at '" + pointer + "': " + what);
}

std::string require_string(const json& node, const char* key,
                           const std::filesystem::path& file, const std::string& pointer) {
    const auto it = node.find(key);
    if (it == node.end() || !it->is_string()) {
        fail(file, pointer, std::string("expected string member '") + key + "'");
    }
    return it->get<std::string>();
}

std::optional<bool> optional_bool(const json& node, const char* key,
                                  const std::filesystem::path& file, const std::string& pointer) {
    const auto it = node.find(key);
    if (it == node.end()) {
        return std::nullopt;
    }
    if (!it->is_boolean()) {
        fail(file, pointer + "/" + key, "expected boolean");
    }
    return it->get<bool>();
}

std::optional<std::vector<std::string>> parse_modes(const json& node,
                                                    const std::filesystem::path& file,
                                                    const std::string& pointer) {
    const auto it = node.find("modes");
    if (it == node.end()) {
        return std::nullopt;
    }
    if (!it->is_array()) {
        fail(file, pointer + "/modes", "expected array of mode names");
    }
    std::vector<std::string> modes;
    modes.reserve(it->size());
    for (std::size_t i = 0; i < it->size(); ++i) {
        const auto& mode = (*it)[i];
        if (!mode.is_string()) {
            fail(file, pointer + "/modes/" + std::to_string(i), "expected string");
        }
        modes.push_back(mode.get<std::string>());
    }
    return modes;
}

TestCase parse_case(const json& node, const std::filesystem::path& file,
                    const std::string& pointer) {
    if (!node.is_object()) {
        fail(file, pointer, "expected test object");
    }

    TestCase test;
    test.description = require_string(node, "description", file, pointer);

    const auto valid = optional_bool(node, "valid", file, pointer);
    if (!valid) {
        fail(file, pointer, "missing boolean member 'valid'");
    }
    test.valid = *valid;

    if (const auto it = node.find("data"); it != node.end()) {
        test.data = *it;
    }
    if (const auto it = node.find("expect"); it != node.end()) {
        test.expect = *it;
    }
    test.modes = parse_modes(node, file, pointer);
    return test;
}

TestGroup parse_group(const json& node, const std::filesystem::path& file,
                      const std::string& pointer) {
    if (!node.is_object()) {
        fail(file, pointer, "expected group object");
    }

    TestGroup group;
    group.description = require_string(node, "description", file, pointer);

    const auto schema = node.find("schema");
    if (schema == node.end()) {
        fail(file, pointer, "missing member 'schema'");
    }
    group.schema = *schema;
    group.valid = optional_bool(node, "valid", file, pointer);

    const auto tests = node.find("tests");
    if (tests == node.end()) {
        if (!group.valid) {
            fail(file, pointer, "group without 'tests' must declare boolean 'valid'");
        }
        return group;
    }
    if (!tests->is_array()) {
        fail(file, pointer + "/tests", "expected array");
    }

    std::vector<TestCase> cases;
    cases.reserve(tests->size());
    for (std::size_t i = 0; i < tests->size(); ++i) {
        cases.push_back(parse_case((*tests)[i], file, pointer + "/tests/" + std::to_string(i)));
    }
    group.cases = std::move(cases);
    return group;
}

}  // namespace

namespace jsonschema::conformance {

CollectionLoader::CollectionLoader(Options options) : options_{std::move(options)} {}

Collection CollectionLoader::load(const std::filesystem::path& file,
                                  const std::optional<std::string>& version) const {
    if (!std::filesystem::exists(file)) {
        throw FixtureError("Fixture file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw FixtureError("Fixture path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw FixtureError("Unable to open fixture file: " + file.string());
    }

    json document;
    try {
        document = json::parse(input);
    } catch (const json::parse_error& ex) {
        throw FixtureError("Unable to parse fixture file " + file.string() + ": " + ex.what());
    }

    if (!document.is_array()) {
        fail(file, "", "expected top-level array of groups");
    }

    Collection collection;
    collection.file_path = file.string();
    collection.version = version;
    collection.groups.reserve(document.size());
    for (std::size_t i = 0; i < document.size(); ++i) {
        collection.groups.push_back(parse_group(document[i], file, "/" + std::to_string(i)));
    }
    return collection;
}

std::vector<Collection> CollectionLoader::load_directory(
    const std::filesystem::path& root,
    const std::optional<std::string>& version) const {
    if (!std::filesystem::exists(root)) {
        throw FixtureError("Fixture root does not exist: " + root.string());
    }

    if (!std::filesystem::is_directory(root)) {
        return {load(root, version)};
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        if (!options_.extension.empty() && entry.path().extension() != options_.extension) {
            continue;
        }
        files.emplace_back(entry.path());
    }

    std::sort(files.begin(), files.end());

    std::vector<Collection> collections;
    collections.reserve(files.size());
    for (const auto& path : files) {
        collections.emplace_back(load(path, version));
    }
    return collections;
}

}  // namespace jsonschema::conformance
