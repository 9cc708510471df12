#pragma once
#include <guildbank/schema/primitives.hpp>

namespace guildbank::schema {

template <uint16_t Version>
struct wallet_state;

template <>
struct wallet_state<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  currency_id_t currency_id{};
  amount_t balance{};
};

using wallet_state_t = wallet_state<1>;

}  // namespace guildbank::schema
