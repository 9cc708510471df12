#pragma once
#include <guildbank/schema/primitives.hpp>
#include <string>

namespace guildbank::schema {

template <uint16_t Version>
struct guild_state;

template <>
struct guild_state<1> final {
  uint16_t version{1};
  guild_id_t guild_id{};
  std::string external_id;
  group_id_t single_group_id{};
  timestamp_milliseconds_t created_at{};
};

using guild_state_t = guild_state<1>;

}  // namespace guildbank::schema
