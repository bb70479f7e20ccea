#pragma once

#include "ignore_registry.hpp"
#include "result_log.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace jsonschema::conformance {

enum class LineStatus {
    Pass,
    Fail,
    Ignored,
};

struct ReportLine {
    LineStatus status{LineStatus::Fail};
    std::string text;
    std::size_t record_index{0};  ///< Position of the originating record in the log.
};

/**
 * \brief Result of the single reporting pass over a finished log.
 *
 * `failed` never includes ignored failures, so `succeeded + failed` may be smaller
 * than the number of records.
 */
struct Report {
    std::vector<ReportLine> lines;
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::size_t ignored{0};
};

/**
 * \brief Builds the report model without touching any output.
 *
 * Every failing record yields a line, ignored ones included. Passing records only
 * yield lines when `verbose` is set.
 */
[[nodiscard]] Report build_report(const std::vector<LogRecord>& records,
                                  const IgnoreRegistry& ignores,
                                  bool verbose = false);

/// 0 when no non-ignored failure occurred, 1 otherwise.
[[nodiscard]] int exit_code(const Report& report) noexcept;

enum class OutputStyle {
    Ansi,   ///< Coloured terminal lines.
    Plain,  ///< Same text without escape codes.
    Html,   ///< `<pre>` blocks for non-interactive hosts.
};

/// Parses `ansi`, `plain` or `html`; throws std::invalid_argument otherwise.
[[nodiscard]] OutputStyle parse_output_style(std::string_view name);

/**
 * \brief Writes a report to a stream in one of the supported styles.
 */
class Reporter {
public:
    explicit Reporter(OutputStyle style) : style_{style} {}

    /// Renders every report line followed by the two summary lines.
    void render(const Report& report, std::ostream& out) const;

private:
    void line(std::ostream& out, std::string_view text, bool success) const;

    OutputStyle style_;
};

}  // namespace jsonschema::conformance
