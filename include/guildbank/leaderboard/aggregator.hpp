#pragma once

#include <guildbank/currency/registry.hpp>
#include <guildbank/exchange/engine.hpp>
#include <guildbank/ledger/ledger.hpp>
#include <guildbank/schema/currency_state.hpp>
#include <guildbank/schema/operation_result.hpp>
#include <cstddef>
#include <vector>

namespace guildbank::leaderboard {

inline constexpr auto kDefaultLimit = std::size_t{5};

struct entry final {
  guildbank::schema::account_id_t account_id{};
  guildbank::schema::rate_t converted_balance;
};

struct standings final {
  guildbank::schema::currency_state_t currency;
  std::vector<entry> entries;
};

/// Reads committed balances at call time; no snapshot is held.
class aggregator final {
 public:
  aggregator(const guildbank::currency::registry& registry,
             const guildbank::exchange::engine& engine,
             const guildbank::ledger::ledger& ledger);

  /// Balances in the target count as is, other group currencies count
  /// through a configured rate into the target, the rest count as zero.
  /// Ordered by converted total descending, ties by account creation order.
  /// Accounts with a zero total are omitted.
  guildbank::schema::operation_result<standings> top(
      guildbank::schema::group_id_t group_id,
      guildbank::schema::currency_id_t target_currency_id,
      std::size_t limit = kDefaultLimit) const;

 private:
  const guildbank::currency::registry& registry_;
  const guildbank::exchange::engine& engine_;
  const guildbank::ledger::ledger& ledger_;
};

}  // namespace guildbank::leaderboard
