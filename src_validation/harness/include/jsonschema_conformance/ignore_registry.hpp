#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace jsonschema::conformance {

/**
 * \brief Substring patterns for known-failing cases.
 *
 * A failure whose rendered message contains any registered pattern is still shown
 * but no longer counts against the run. Matching is exact and case-sensitive.
 */
class IgnoreRegistry {
public:
    IgnoreRegistry() = default;

    void ignore(std::string pattern);

    /**
     * Reads one pattern per line. Blank lines and lines starting with `#` are skipped,
     * surrounding whitespace is trimmed. Throws std::runtime_error if the file cannot be read.
     */
    void load_file(const std::filesystem::path& file);

    [[nodiscard]] bool should_ignore(std::string_view message) const noexcept;

    [[nodiscard]] const std::vector<std::string>& patterns() const noexcept { return patterns_; }

private:
    std::vector<std::string> patterns_;
};

}  // namespace jsonschema::conformance
