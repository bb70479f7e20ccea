#include "jsonschema_conformance/result_log.hpp"

#include <iterator>
#include <string>
#include <utility>

namespace jsonschema::conformance {

std::string LogRecord::message() const {
    std::string msg;
    auto add = [&msg](const std::string& part) {
        if (part.empty()) {
            return;
        }
        if (!msg.empty()) {
            msg += kMessageSeparator;
        }
        msg += part;
    };

    add(file);
    add(group_description);
    if (case_description) {
        add(*case_description);
    }
    if (error) {
        add(*error);
    }
    return msg;
}

std::string_view to_string(CheckKind kind) noexcept {
    switch (kind) {
        case CheckKind::Schema: return "schema";
        case CheckKind::Data:   return "data";
    }
    return "unknown";
}

std::string_view to_string(FailureFlavor flavor) noexcept {
    switch (flavor) {
        case FailureFlavor::None:      return "none";
        case FailureFlavor::Mismatch:  return "mismatch";
        case FailureFlavor::HardError: return "hard_error";
    }
    return "unknown";
}

void ResultLog::append(LogRecord record) {
    records_.push_back(std::move(record));
}

void ResultLog::splice(ResultLog&& other) {
    records_.insert(records_.end(),
                    std::make_move_iterator(other.records_.begin()),
                    std::make_move_iterator(other.records_.end()));
    other.records_.clear();
}

}  // namespace jsonschema::conformance
