#pragma once

#include "backend.hpp"
#include "collection.hpp"
#include "collection_loader.hpp"
#include "ignore_registry.hpp"
#include "reporter.hpp"
#include "result_log.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace jsonschema::conformance {

struct RunResult {
    ResultLog log;
    Report report;
};

/**
 * \brief Drives every loaded collection through a validation backend.
 *
 * Collections are loaded eagerly by add_collection(), so fixture errors surface
 * before any check runs. run() executes the schema check of each group followed
 * by its data checks, then builds the report once against the ignore registry.
 *
 * With `jobs > 1` groups are spread over worker threads. Each group writes into
 * its own buffer and buffers are joined in load order, so the log is identical to
 * a sequential run.
 */
class Engine {
public:
    struct Config {
        std::size_t jobs{1};
        bool verbose{false};
        CollectionLoader::Options loader{};
    };

    explicit Engine(const Backend& backend);
    Engine(const Backend& backend, Config config);

    void add_collection(const std::filesystem::path& directory,
                        const std::optional<std::string>& version = std::nullopt);

    void ignore(std::string pattern);
    void ignore_file(const std::filesystem::path& file);

    [[nodiscard]] RunResult run() const;

    [[nodiscard]] const std::vector<Collection>& collections() const noexcept { return collections_; }
    [[nodiscard]] const IgnoreRegistry& ignores() const noexcept { return ignores_; }

private:
    const Backend& backend_;
    Config config_;
    std::vector<Collection> collections_;
    IgnoreRegistry ignores_;
};

}  // namespace jsonschema::conformance
