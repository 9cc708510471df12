#pragma once
#include <guildbank/schema/group_kind.hpp>
#include <guildbank/schema/primitives.hpp>
#include <optional>

namespace guildbank::schema {

template <uint16_t Version>
struct group_state;

template <>
struct group_state<1> final {
  uint16_t version{1};
  group_id_t group_id{};
  group_kind_t kind{group_kind_t::local};
  // Guild that created the group; absent for the global group.
  std::optional<guild_id_t> owner_guild_id;
  std::optional<currency_id_t> primary_currency_id;
  timestamp_milliseconds_t created_at{};
};

using group_state_t = group_state<1>;

}  // namespace guildbank::schema
