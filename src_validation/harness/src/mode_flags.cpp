#include "jsonschema_conformance/mode_flags.hpp"

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using jsonschema::conformance::ModeFlag;

constexpr std::array<std::pair<std::string_view, ModeFlag>, 2> kModeNames{{
    {"CAST", ModeFlag::Cast},
    {"REMOVE_ADDITIONALS", ModeFlag::RemoveAdditionals},
}};

}  // namespace

namespace jsonschema::conformance {

ModeFlag mode_from_name(std::string_view name) noexcept {
    for (const auto& [key, flag] : kModeNames) {
        if (key == name) {
            return flag;
        }
    }
    return ModeFlag::None;
}

ModeFlag modes_from_names(const std::vector<std::string>& names) noexcept {
    ModeFlag flags = ModeFlag::None;
    for (const auto& name : names) {
        flags |= mode_from_name(name);
    }
    return flags;
}

std::string to_string(ModeFlag flags) {
    std::string out;
    for (const auto& [key, flag] : kModeNames) {
        if (!has_flag(flags, flag)) {
            continue;
        }
        if (!out.empty()) {
            out += '|';
        }
        out += key;
    }
    return out.empty() ? std::string{"NONE"} : out;
}

}  // namespace jsonschema::conformance
