#pragma once

#include <guildbank/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Federation scope a group represents: the process-wide global group, the
// per-guild single group, or a local group several guilds opt into.
namespace guildbank::schema {

enum class group_kind_t : uint8_t {
  global = 0,
  single = 1,
  local = 2,
};

inline constexpr auto kGroupKindNames =
    std::array<std::pair<std::string_view, group_kind_t>, 3>{{
        {"global", group_kind_t::global},
        {"single", group_kind_t::single},
        {"local", group_kind_t::local},
    }};

constexpr std::string_view kind_name(const group_kind_t kind) {
  return to_string(kind, kGroupKindNames).value_or("unknown");
}

}  // namespace guildbank::schema
