#include "jsonschema_conformance/metrics_writer.hpp"

#include "html_escape.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using jsonschema::conformance::LineStatus;
using jsonschema::conformance::LogRecord;
using jsonschema::conformance::RunResult;
using jsonschema::conformance::detail::escape_html;
using nlohmann::json;

// PASS / FAIL / IGNORED per record, in log order.
std::vector<std::string> record_statuses(const RunResult& run) {
    const auto& records = run.log.records();
    std::vector<std::string> statuses(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        statuses[i] = records[i].valid ? "PASS" : "FAIL";
    }
    for (const auto& line : run.report.lines) {
        if (line.status == LineStatus::Ignored && line.record_index < statuses.size()) {
            statuses[line.record_index] = "IGNORED";
        }
    }
    return statuses;
}

json record_to_json(const LogRecord& record, const std::string& status) {
    json out = {
        {"status", status},
        {"kind", std::string{to_string(record.kind)}},
        {"flavor", std::string{to_string(record.flavor)}},
        {"file", record.file},
        {"group", record.group_description},
        {"message", record.message()},
    };
    out["case"] = record.case_description ? json(*record.case_description) : json(nullptr);
    out["error"] = record.error ? json(*record.error) : json(nullptr);
    return out;
}

json build_summary(const RunResult& run) {
    const auto statuses = record_statuses(run);
    json summary = {
        {"total", run.log.size()},
        {"succeeded", run.report.succeeded},
        {"failed", run.report.failed},
        {"ignored", run.report.ignored},
        {"exit_code", exit_code(run.report)},
        {"records", json::array()},
    };

    const auto& records = run.log.records();
    for (std::size_t i = 0; i < records.size(); ++i) {
        summary["records"].push_back(record_to_json(records[i], statuses[i]));
    }
    return summary;
}

std::string render_html(const RunResult& run) {
    const auto statuses = record_statuses(run);
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>JSON Schema Conformance Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << ".status-PASS{color:#0a7c2f;font-weight:bold;}"
        << ".status-FAIL{color:#c1121f;font-weight:bold;}"
        << ".status-IGNORED{color:#ff8800;font-weight:bold;}"
        << "</style></head><body>";

    oss << "<h1>JSON Schema Conformance Report</h1>";

    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Total checks: " << run.log.size() << "</li>";
    oss << "<li>Succeeded: " << run.report.succeeded << "</li>";
    oss << "<li>Failed: " << run.report.failed << "</li>";
    oss << "<li>Ignored: " << run.report.ignored << "</li>";
    oss << "</ul></section>";

    oss << "<section><h2>Checks</h2><table>";
    oss << "<thead><tr>"
        << "<th>#</th>"
        << "<th>File</th>"
        << "<th>Group</th>"
        << "<th>Case</th>"
        << "<th>Kind</th>"
        << "<th>Status</th>"
        << "<th>Error</th>"
        << "</tr></thead><tbody>";

    const auto& records = run.log.records();
    for (std::size_t index = 0; index < records.size(); ++index) {
        const auto& record = records[index];
        const auto status_class = "status-" + statuses[index];

        oss << "<tr>";
        oss << "<td>" << (index + 1) << "</td>";
        oss << "<td>" << escape_html(record.file) << "</td>";
        oss << "<td>" << escape_html(record.group_description) << "</td>";
        oss << "<td>" << escape_html(record.case_description.value_or("")) << "</td>";
        oss << "<td>" << to_string(record.kind) << "</td>";
        oss << "<td class=\"" << escape_html(status_class) << "\">"
            << escape_html(statuses[index]) << "</td>";
        oss << "<td>" << escape_html(record.error.value_or("")) << "</td>";
        oss << "</tr>";
    }

    oss << "</tbody></table></section>";
    oss << "</body></html>";
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace jsonschema::conformance {

void MetricsWriter::write_summary(const std::filesystem::path& destination,
                                  const RunResult& run) const {
    const json summary = build_summary(run);
    write_file(destination, summary.dump(2));
}

void MetricsWriter::write_detailed(const std::filesystem::path& destination,
                                   const RunResult& run) const {
    const auto html = render_html(run);
    write_file(destination, html);
}

}  // namespace jsonschema::conformance
