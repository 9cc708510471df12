#pragma once
#include <guildbank/schema/primitives.hpp>
#include <string>

// Directional conversion edge: one unit of base buys `rate` units of quote.
namespace guildbank::schema {

template <uint16_t Version>
struct exchange_rate;

template <>
struct exchange_rate<1> final {
  uint16_t version{1};
  group_id_t group_id{};
  currency_id_t base_currency_id{};
  currency_id_t quote_currency_id{};
  // Decimal text, parsed with try_make_rate.
  std::string rate;
  timestamp_milliseconds_t updated_at{};
};

using exchange_rate_t = exchange_rate<1>;

}  // namespace guildbank::schema
