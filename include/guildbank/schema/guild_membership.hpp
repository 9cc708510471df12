#pragma once
#include <guildbank/schema/primitives.hpp>

namespace guildbank::schema {

template <uint16_t Version>
struct guild_membership;

template <>
struct guild_membership<1> final {
  uint16_t version{1};
  guild_id_t guild_id{};
  group_id_t group_id{};
  timestamp_milliseconds_t joined_at{};
};

using guild_membership_t = guild_membership<1>;

}  // namespace guildbank::schema
