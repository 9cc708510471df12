#pragma once
#include <guildbank/schema/primitives.hpp>
#include <string>

// Internal identity bound to one external user. Holds no balance; see
// wallet_state.
namespace guildbank::schema {

template <uint16_t Version>
struct account_state;

template <>
struct account_state<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  std::string external_id;
  timestamp_milliseconds_t created_at{};
};

using account_state_t = account_state<1>;

}  // namespace guildbank::schema
