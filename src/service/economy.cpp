#include <guildbank/audit/sink.hpp>
#include <guildbank/service/economy.hpp>
#include <map>
#include <string>
#include <utility>

using namespace guildbank::schema;

namespace guildbank::service {

economy::economy(guildbank::storage::rocksdb_storage_t& storage,
                 bytes_t note_secret,
                 guildbank::audit::alert_handler_t alert_handler)
    : resolver_{storage},
      registry_{storage},
      engine_{storage},
      audit_{guildbank::audit::make_storage_sink(storage),
             std::move(alert_handler)},
      ledger_{storage, registry_, engine_, audit_},
      notes_{storage,
             resolver_,
             registry_,
             ledger_,
             audit_,
             guildbank::notes::token_codec{std::move(note_secret)}},
      aggregator_{registry_, engine_, ledger_} {}

operation_result<guild_state_t> economy::onboard_guild(
    const std::string_view guild) {
  return resolver_.onboard_guild(guild);
}

operation_result<currency_state_t> economy::create_currency(
    const std::string_view guild,
    const std::string_view display_name) {
  try {
    auto group_id = single_group_of(guild);
    if (!group_id) {
      return make_failure<currency_state_t>(error_code::guild_not_found,
                                            "guild is not onboarded");
    }
    return registry_.create_currency(*group_id, display_name);
  } catch (const guildbank::storage::storage_unavailable& ex) {
    return make_failure<currency_state_t>(error_code::storage_unavailable,
                                          ex.what());
  }
}

operation_result<currency_state_t> economy::set_primary_currency(
    const std::string_view guild,
    const std::string_view display_name) {
  auto currency = resolve_currency(guild, display_name);
  if (!currency.ok()) {
    return currency;
  }
  return registry_.set_primary_currency(currency.value->group_id,
                                        currency.value->currency_id);
}

operation_result<exchange_rate_t> economy::set_exchange_rate(
    const std::string_view guild,
    const std::string_view base_currency,
    const std::string_view quote_currency,
    const std::string_view rate) {
  auto parsed = try_make_rate(rate);
  if (!parsed) {
    return make_failure<exchange_rate_t>(
        error_code::invalid_rate,
        "'" + std::string{rate} + "' is not a decimal rate");
  }
  auto base = resolve_currency(guild, base_currency);
  if (!base.ok()) {
    return make_failure<exchange_rate_t>(base.code, base.log);
  }
  auto quote = resolve_currency(guild, quote_currency);
  if (!quote.ok()) {
    return make_failure<exchange_rate_t>(quote.code, quote.log);
  }
  return registry_.set_exchange_rate(base.value->group_id,
                                     base.value->currency_id,
                                     quote.value->currency_id, *parsed);
}

operation_result<wallet_state_t> economy::grant(
    const std::string_view guild,
    const std::string_view user,
    const amount_t amount,
    const std::optional<std::string_view> currency) {
  auto resolved = resolve_currency(guild, currency);
  if (!resolved.ok()) {
    return make_failure<wallet_state_t>(resolved.code, resolved.log);
  }
  auto account = resolver_.resolve_account(user);
  if (!account.ok()) {
    return make_failure<wallet_state_t>(account.code, account.log);
  }
  return ledger_.mint(account.value->account_id, resolved.value->currency_id,
                      amount);
}

operation_result<wallet_state_t> economy::take(
    const std::string_view guild,
    const std::string_view user,
    const amount_t amount,
    const std::optional<std::string_view> currency) {
  auto resolved = resolve_currency(guild, currency);
  if (!resolved.ok()) {
    return make_failure<wallet_state_t>(resolved.code, resolved.log);
  }
  auto account = resolver_.resolve_account(user);
  if (!account.ok()) {
    return make_failure<wallet_state_t>(account.code, account.log);
  }
  return ledger_.burn(account.value->account_id, resolved.value->currency_id,
                      amount);
}

operation_result<guildbank::ledger::transfer_receipt> economy::pay(
    const std::string_view guild,
    const std::string_view from_user,
    const std::string_view to_user,
    const amount_t amount,
    const std::optional<std::string_view> currency) {
  using result_t = guildbank::ledger::transfer_receipt;
  auto resolved = resolve_currency(guild, currency);
  if (!resolved.ok()) {
    return make_failure<result_t>(resolved.code, resolved.log);
  }
  auto from = resolver_.resolve_account(from_user);
  if (!from.ok()) {
    return make_failure<result_t>(from.code, from.log);
  }
  auto to = resolver_.resolve_account(to_user);
  if (!to.ok()) {
    return make_failure<result_t>(to.code, to.log);
  }
  return ledger_.transfer(from.value->account_id, to.value->account_id,
                          resolved.value->currency_id, amount);
}

operation_result<guildbank::ledger::exchange_receipt> economy::convert(
    const std::string_view guild,
    const std::string_view user,
    const std::string_view from_currency,
    const std::string_view to_currency,
    const amount_t amount) {
  using result_t = guildbank::ledger::exchange_receipt;
  auto from = resolve_currency(guild, from_currency);
  if (!from.ok()) {
    return make_failure<result_t>(from.code, from.log);
  }
  auto to = resolve_currency(guild, to_currency);
  if (!to.ok()) {
    return make_failure<result_t>(to.code, to.log);
  }
  auto account = resolver_.resolve_account(user);
  if (!account.ok()) {
    return make_failure<result_t>(account.code, account.log);
  }
  return ledger_.exchange(account.value->account_id, from.value->currency_id,
                          to.value->currency_id, amount);
}

operation_result<std::vector<balance_line>> economy::balances(
    const std::string_view guild,
    const std::string_view user) {
  using result_t = std::vector<balance_line>;
  try {
    auto group_id = single_group_of(guild);
    if (!group_id) {
      return make_failure<result_t>(error_code::guild_not_found,
                                    "guild is not onboarded");
    }
    auto lines = result_t{};
    auto account = resolver_.find_account(user);
    auto held = account ? ledger_.balance_of(account->account_id)
                        : std::map<currency_id_t, amount_t>{};
    for (auto& currency : registry_.currencies(*group_id)) {
      auto balance = held.find(currency.currency_id);
      lines.push_back(balance_line{
          .currency = std::move(currency),
          .balance = balance != std::end(held) ? balance->second : 0});
    }
    return make_success(std::move(lines));
  } catch (const guildbank::storage::storage_unavailable& ex) {
    return make_failure<result_t>(error_code::storage_unavailable, ex.what());
  }
}

operation_result<guildbank::notes::issued_note> economy::issue_note(
    const std::string_view guild,
    const std::string_view issuer,
    const std::string_view recipient,
    const amount_t amount,
    const std::optional<std::string_view> currency) {
  using result_t = guildbank::notes::issued_note;
  auto resolved = resolve_currency(guild, currency);
  if (!resolved.ok()) {
    return make_failure<result_t>(resolved.code, resolved.log);
  }
  auto account = resolver_.resolve_account(issuer);
  if (!account.ok()) {
    return make_failure<result_t>(account.code, account.log);
  }
  return notes_.issue(account.value->account_id, recipient,
                      resolved.value->currency_id, amount);
}

operation_result<guildbank::notes::redemption> economy::redeem_note(
    const std::string_view redeemer,
    const std::string_view token) {
  return notes_.redeem(redeemer, token);
}

operation_result<guildbank::leaderboard::standings> economy::leaderboard(
    const std::string_view guild,
    const std::optional<std::string_view> currency,
    const std::size_t limit) const {
  using result_t = guildbank::leaderboard::standings;
  auto resolved = resolve_currency(guild, currency);
  if (!resolved.ok()) {
    return make_failure<result_t>(resolved.code, resolved.log);
  }
  return aggregator_.top(resolved.value->group_id, resolved.value->currency_id,
                         limit);
}

guildbank::audit::flush_result economy::flush_audit(
    const std::size_t max_batch_size) {
  return audit_.flush(max_batch_size);
}

std::optional<group_id_t> economy::single_group_of(
    const std::string_view guild) const {
  auto state = resolver_.find_guild(guild);
  if (!state) {
    return std::nullopt;
  }
  return state->single_group_id;
}

operation_result<currency_state_t> economy::resolve_currency(
    const std::string_view guild,
    const std::optional<std::string_view> currency) const {
  try {
    auto group_id = single_group_of(guild);
    if (!group_id) {
      return make_failure<currency_state_t>(error_code::guild_not_found,
                                            "guild is not onboarded");
    }
    auto state = currency ? registry_.find_currency(*group_id, *currency)
                          : registry_.primary_currency(*group_id);
    if (!state) {
      return make_failure<currency_state_t>(
          error_code::currency_not_found,
          currency ? "no currency named '" + std::string{*currency} + "'"
                   : std::string{"guild has no primary currency"});
    }
    return make_success(*state);
  } catch (const guildbank::storage::storage_unavailable& ex) {
    return make_failure<currency_state_t>(error_code::storage_unavailable,
                                          ex.what());
  }
}

}  // namespace guildbank::service
