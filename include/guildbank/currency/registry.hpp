#pragma once

#include <guildbank/schema/currency_state.hpp>
#include <guildbank/schema/exchange_rate.hpp>
#include <guildbank/schema/operation_result.hpp>
#include <guildbank/storage/rocksdb/storage.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace guildbank::currency {

/// Owns currency definitions, the per-group primary currency and exchange
/// rates. Every mutation locks the group record, so currency administration
/// within one group is serialized.
class registry final {
 public:
  explicit registry(guildbank::storage::rocksdb_storage_t& storage);

  /// Create a currency in the group. The first currency of a group becomes
  /// its primary currency. Display names are unique per group.
  guildbank::schema::operation_result<guildbank::schema::currency_state_t>
  create_currency(guildbank::schema::group_id_t group_id,
                  std::string_view display_name);

  guildbank::schema::operation_result<guildbank::schema::currency_state_t>
  set_primary_currency(guildbank::schema::group_id_t group_id,
                       guildbank::schema::currency_id_t currency_id);

  /// Create or replace the directional rate base -> quote.
  guildbank::schema::operation_result<guildbank::schema::exchange_rate_t>
  set_exchange_rate(guildbank::schema::group_id_t group_id,
                    guildbank::schema::currency_id_t base_currency_id,
                    guildbank::schema::currency_id_t quote_currency_id,
                    const guildbank::schema::rate_t& rate);

  std::optional<guildbank::schema::currency_state_t> find_currency(
      guildbank::schema::currency_id_t currency_id) const;
  std::optional<guildbank::schema::currency_state_t> find_currency(
      guildbank::schema::group_id_t group_id,
      std::string_view display_name) const;
  std::optional<guildbank::schema::currency_state_t> primary_currency(
      guildbank::schema::group_id_t group_id) const;
  std::vector<guildbank::schema::currency_state_t> currencies(
      guildbank::schema::group_id_t group_id) const;
  std::vector<guildbank::schema::exchange_rate_t> exchange_rates(
      guildbank::schema::group_id_t group_id) const;

 private:
  guildbank::storage::rocksdb_storage_t& storage_;
};

}  // namespace guildbank::currency
