#pragma once

#include <guildbank/schema/primitives.hpp>
#include <guildbank/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>

namespace guildbank::exchange {

/// Read-only view over the directional rates configured in a group. Only
/// configured edges are honored: no multi-hop paths and no inverted rates.
class engine final {
 public:
  explicit engine(const guildbank::storage::rocksdb_storage_t& storage);

  std::optional<guildbank::schema::rate_t> rate_for(
      guildbank::schema::group_id_t group_id,
      guildbank::schema::currency_id_t base_currency_id,
      guildbank::schema::currency_id_t quote_currency_id) const;

  /// Keyed by base currency.
  std::map<guildbank::schema::currency_id_t, guildbank::schema::rate_t>
  rates_into(guildbank::schema::group_id_t group_id,
             guildbank::schema::currency_id_t quote_currency_id) const;

  /// floor(amount * rate). std::nullopt when the result does not fit a
  /// balance.
  static std::optional<guildbank::schema::amount_t> convert(
      guildbank::schema::amount_t amount,
      const guildbank::schema::rate_t& rate);

 private:
  const guildbank::storage::rocksdb_storage_t& storage_;
};

}  // namespace guildbank::exchange
