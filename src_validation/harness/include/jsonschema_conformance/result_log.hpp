#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonschema::conformance {

enum class CheckKind {
    Schema,
    Data,
};

/// Why a check failed. Both flavours render identically but have different root causes.
enum class FailureFlavor {
    None,
    Mismatch,   ///< Engine verdict differs from the fixture's expectation.
    HardError,  ///< Engine raised something other than a schema/validation error.
};

/**
 * \brief Outcome of one executed check.
 */
struct LogRecord {
    bool valid{false};
    std::string file;
    std::string group_description;
    std::optional<std::string> case_description;
    std::optional<std::string> error;
    CheckKind kind{CheckKind::Schema};
    FailureFlavor flavor{FailureFlavor::None};

    /// Non-empty fields of {file, group, case, error} joined with " | ".
    [[nodiscard]] std::string message() const;
};

inline constexpr std::string_view kMessageSeparator = " | ";

[[nodiscard]] std::string_view to_string(CheckKind kind) noexcept;
[[nodiscard]] std::string_view to_string(FailureFlavor flavor) noexcept;

/**
 * \brief Append-only, ordered sequence of check outcomes.
 */
class ResultLog {
public:
    ResultLog() = default;

    void append(LogRecord record);

    /// Moves every record of `other` to the end of this log, preserving order.
    void splice(ResultLog&& other);

    [[nodiscard]] const std::vector<LogRecord>& records() const noexcept { return records_; }
    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

private:
    std::vector<LogRecord> records_;
};

}  // namespace jsonschema::conformance
