#pragma once

#include <guildbank/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace guildbank::schema {

enum class error_code : uint32_t {
  ok = 0,
  invalid_amount = 1,
  self_transfer = 2,
  currency_not_found = 3,
  insufficient_balance = 4,
  rate_not_found = 5,
  invalid_signature = 6,
  recipient_mismatch = 7,
  already_consumed = 8,
  note_not_found = 9,
  storage_unavailable = 10,
  group_not_found = 11,
  guild_not_found = 12,
  account_not_found = 13,
  currency_exists = 14,
  invalid_rate = 15,
  balance_overflow = 16,
  invalid_group = 17,
};

inline constexpr auto kErrorCodeNames =
    std::array<std::pair<std::string_view, error_code>, 18>{{
        {"ok", error_code::ok},
        {"invalid_amount", error_code::invalid_amount},
        {"self_transfer", error_code::self_transfer},
        {"currency_not_found", error_code::currency_not_found},
        {"insufficient_balance", error_code::insufficient_balance},
        {"rate_not_found", error_code::rate_not_found},
        {"invalid_signature", error_code::invalid_signature},
        {"recipient_mismatch", error_code::recipient_mismatch},
        {"already_consumed", error_code::already_consumed},
        {"note_not_found", error_code::note_not_found},
        {"storage_unavailable", error_code::storage_unavailable},
        {"group_not_found", error_code::group_not_found},
        {"guild_not_found", error_code::guild_not_found},
        {"account_not_found", error_code::account_not_found},
        {"currency_exists", error_code::currency_exists},
        {"invalid_rate", error_code::invalid_rate},
        {"balance_overflow", error_code::balance_overflow},
        {"invalid_group", error_code::invalid_group},
    }};

constexpr std::string_view error_name(const error_code code) {
  return to_string(code, kErrorCodeNames).value_or("unknown");
}

}  // namespace guildbank::schema
