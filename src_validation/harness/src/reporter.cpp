#include "jsonschema_conformance/reporter.hpp"

#include "html_escape.hpp"

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace {

constexpr std::string_view kAnsiFail = "\033[0;31;40m";
constexpr std::string_view kAnsiPass = "\033[0;32;40m";
constexpr std::string_view kAnsiReset = "\033[0m";
constexpr std::string_view kIgnoredTag = "[ignored] ";

}  // namespace

namespace jsonschema::conformance {

Report build_report(const std::vector<LogRecord>& records,
                    const IgnoreRegistry& ignores,
                    bool verbose) {
    Report report;
    for (std::size_t index = 0; index < records.size(); ++index) {
        const auto& record = records[index];

        if (record.valid) {
            ++report.succeeded;
            if (verbose) {
                report.lines.push_back({LineStatus::Pass, record.message(), index});
            }
            continue;
        }

        auto msg = record.message();
        if (ignores.should_ignore(msg)) {
            ++report.ignored;
            report.lines.push_back({LineStatus::Ignored, std::move(msg), index});
            continue;
        }

        ++report.failed;
        report.lines.push_back({LineStatus::Fail, std::move(msg), index});
    }
    return report;
}

int exit_code(const Report& report) noexcept {
    return report.failed == 0 ? 0 : 1;
}

OutputStyle parse_output_style(std::string_view name) {
    if (name == "ansi") {
        return OutputStyle::Ansi;
    }
    if (name == "plain") {
        return OutputStyle::Plain;
    }
    if (name == "html") {
        return OutputStyle::Html;
    }
    throw std::invalid_argument("Unknown output format '" + std::string{name} +
                                "' (expected ansi, plain or html)");
}

void Reporter::render(const Report& report, std::ostream& out) const {
    for (const auto& entry : report.lines) {
        switch (entry.status) {
            case LineStatus::Pass:
                line(out, entry.text, true);
                break;
            case LineStatus::Fail:
                line(out, entry.text, false);
                break;
            case LineStatus::Ignored:
                line(out, std::string{kIgnoredTag} + entry.text, false);
                break;
        }
    }

    line(out, "Total Succeed: " + std::to_string(report.succeeded), true);
    line(out, "Total Fail: " + std::to_string(report.failed), false);
    out.flush();
}

void Reporter::line(std::ostream& out, std::string_view text, bool success) const {
    switch (style_) {
        case OutputStyle::Ansi:
            out << '\n' << (success ? kAnsiPass : kAnsiFail) << text << '!' << kAnsiReset << '\n';
            break;
        case OutputStyle::Plain:
            out << '\n' << text << "!\n";
            break;
        case OutputStyle::Html:
            out << "<pre style=\"color: " << (success ? "#a3d39b" : "red") << ";\">"
                << detail::escape_html(text) << "</pre>\n";
            break;
    }
}

}  // namespace jsonschema::conformance
