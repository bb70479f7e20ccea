#include "jsonschema_conformance/ignore_registry.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

}  // namespace

namespace jsonschema::conformance {

void IgnoreRegistry::ignore(std::string pattern) {
    if (std::find(patterns_.begin(), patterns_.end(), pattern) != patterns_.end()) {
        return;
    }
    patterns_.push_back(std::move(pattern));
}

void IgnoreRegistry::load_file(const std::filesystem::path& file) {
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("Ignore list is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open ignore list: " + file.string());
    }

    std::string raw_line;
    while (std::getline(input, raw_line)) {
        auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        ignore(std::move(trimmed));
    }
}

bool IgnoreRegistry::should_ignore(std::string_view message) const noexcept {
    return std::any_of(patterns_.begin(), patterns_.end(), [message](const std::string& pattern) {
        return message.find(pattern) != std::string_view::npos;
    });
}

}  // namespace jsonschema::conformance
