#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace jsonschema::conformance {

/**
 * \brief Validator behaviour toggles. Flags combine with bitwise OR.
 *
 * - Cast: coerce instance values to the schema-declared type where unambiguous.
 * - RemoveAdditionals: strip members and items the schema does not permit.
 */
enum class ModeFlag : std::uint32_t {
    None = 0,
    Cast = 1u << 0,
    RemoveAdditionals = 1u << 1,
};

constexpr ModeFlag operator|(ModeFlag lhs, ModeFlag rhs) noexcept {
    return static_cast<ModeFlag>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

constexpr ModeFlag operator&(ModeFlag lhs, ModeFlag rhs) noexcept {
    return static_cast<ModeFlag>(static_cast<std::uint32_t>(lhs) & static_cast<std::uint32_t>(rhs));
}

constexpr ModeFlag& operator|=(ModeFlag& lhs, ModeFlag rhs) noexcept {
    lhs = lhs | rhs;
    return lhs;
}

constexpr bool has_flag(ModeFlag flags, ModeFlag flag) noexcept {
    return (flags & flag) != ModeFlag::None;
}

/// Maps one fixture mode name (`CAST`, `REMOVE_ADDITIONALS`) to its flag; unknown names give None.
[[nodiscard]] ModeFlag mode_from_name(std::string_view name) noexcept;

/// ORs together the flags of every recognised name.
[[nodiscard]] ModeFlag modes_from_names(const std::vector<std::string>& names) noexcept;

/// Pipe-separated flag names for diagnostics, e.g. `CAST|REMOVE_ADDITIONALS`.
[[nodiscard]] std::string to_string(ModeFlag flags);

}  // namespace jsonschema::conformance
