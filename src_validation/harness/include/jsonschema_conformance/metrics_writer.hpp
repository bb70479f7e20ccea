#pragma once

#include "engine.hpp"

#include <filesystem>

namespace jsonschema::conformance {

/**
 * \brief Emits machine-readable and human-friendly reports for conformance runs.
 *
 * - write_summary(): Produces a JSON document containing per-check results and aggregate counts.
 * - write_detailed(): Produces an HTML report with a tabular view of the checks.
 */
class MetricsWriter {
public:
    MetricsWriter() = default;

    void write_summary(const std::filesystem::path& destination, const RunResult& run) const;

    void write_detailed(const std::filesystem::path& destination, const RunResult& run) const;
};

}  // namespace jsonschema::conformance
