#include <spdlog/spdlog.h>
#include <guildbank/leaderboard/aggregator.hpp>
#include <algorithm>
#include <map>
#include <set>

using namespace guildbank::schema;

namespace guildbank::leaderboard {

aggregator::aggregator(const guildbank::currency::registry& registry,
                       const guildbank::exchange::engine& engine,
                       const guildbank::ledger::ledger& ledger)
    : registry_{registry}, engine_{engine}, ledger_{ledger} {}

operation_result<standings> aggregator::top(const group_id_t group_id,
                                            const currency_id_t target_currency_id,
                                            const std::size_t limit) const {
  try {
    auto target = registry_.find_currency(target_currency_id);
    if (!target || target->group_id != group_id) {
      return make_failure<standings>(error_code::currency_not_found,
                                     "target currency is not part of group");
    }

    auto group_currencies = std::set<currency_id_t>{};
    for (const auto& currency : registry_.currencies(group_id)) {
      group_currencies.insert(currency.currency_id);
    }
    auto rates = engine_.rates_into(group_id, target_currency_id);

    auto totals = std::map<account_id_t, rate_t>{};
    for (const auto& wallet : ledger_.wallets()) {
      if (wallet.balance == 0 || !group_currencies.contains(wallet.currency_id)) {
        continue;
      }
      if (wallet.currency_id == target_currency_id) {
        totals[wallet.account_id] += rate_t{wallet.balance};
        continue;
      }
      auto rate = rates.find(wallet.currency_id);
      if (rate != std::end(rates)) {
        totals[wallet.account_id] += rate_t{wallet.balance} * rate->second;
      }
    }

    auto entries = std::vector<entry>{};
    entries.reserve(totals.size());
    for (const auto& [account_id, total] : totals) {
      if (total > 0) {
        entries.push_back(entry{.account_id = account_id,
                                .converted_balance = total});
      }
    }
    std::ranges::sort(entries, [](const entry& lhs, const entry& rhs) {
      if (lhs.converted_balance != rhs.converted_balance) {
        return lhs.converted_balance > rhs.converted_balance;
      }
      return lhs.account_id < rhs.account_id;
    });
    if (entries.size() > limit) {
      entries.resize(limit);
    }

    spdlog::debug("Leaderboard for group {} in currency {}: {} entries",
                  group_id, target_currency_id, entries.size());
    return make_success(
        standings{.currency = *target, .entries = std::move(entries)});
  } catch (const guildbank::storage::storage_unavailable& ex) {
    return make_failure<standings>(error_code::storage_unavailable, ex.what());
  }
}

}  // namespace guildbank::leaderboard
