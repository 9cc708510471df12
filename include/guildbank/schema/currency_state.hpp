#pragma once
#include <guildbank/schema/primitives.hpp>
#include <string>

namespace guildbank::schema {

template <uint16_t Version>
struct currency_state;

template <>
struct currency_state<1> final {
  uint16_t version{1};
  currency_id_t currency_id{};
  group_id_t group_id{};
  std::string display_name;
  bool primary{false};
  timestamp_milliseconds_t created_at{};
};

using currency_state_t = currency_state<1>;

}  // namespace guildbank::schema
