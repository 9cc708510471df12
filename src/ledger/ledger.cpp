#include <spdlog/spdlog.h>
#include <guildbank/ledger/ledger.hpp>
#include <guildbank/schema/account_state.hpp>
#include <guildbank/schema/encoding/scale/encoder.hpp>
#include <guildbank/schema/key/keys.hpp>
#include <limits>
#include <string>
#include <utility>

using namespace guildbank::schema;

namespace {

using encoder_t = guildbank::schema::encoding::scale_encoder_t;
using guildbank::storage::rocksdb_unit_of_work_t;
using guildbank::storage::storage_unavailable;

struct staged_wallet final {
  error_code code{error_code::ok};
  wallet_state_t wallet;
};

template <typename T>
operation_result<T> reject(const error_code code, std::string log) {
  spdlog::info("Ledger rejected operation ({}): {}", error_name(code), log);
  return make_failure<T>(code, std::move(log));
}

wallet_state_t load_wallet(rocksdb_unit_of_work_t& work,
                           encoder_t& encoder,
                           const account_id_t account_id,
                           const currency_id_t currency_id) {
  auto wallet = work.get_for_update<wallet_state_t>(
      encoder,
      make_bytes_view(key::make_wallet_key(account_id, currency_id)));
  if (wallet) {
    return *wallet;
  }
  return wallet_state_t{
      .account_id = account_id, .currency_id = currency_id, .balance = 0};
}

void store_wallet(rocksdb_unit_of_work_t& work,
                  encoder_t& encoder,
                  const wallet_state_t& wallet) {
  work.put(encoder,
           make_bytes_view(
               key::make_wallet_key(wallet.account_id, wallet.currency_id)),
           wallet);
}

staged_wallet stage_debit(rocksdb_unit_of_work_t& work,
                          encoder_t& encoder,
                          const account_id_t account_id,
                          const currency_id_t currency_id,
                          const amount_t amount) {
  auto wallet = load_wallet(work, encoder, account_id, currency_id);
  if (wallet.balance < amount) {
    return staged_wallet{.code = error_code::insufficient_balance,
                         .wallet = wallet};
  }
  wallet.balance -= amount;
  store_wallet(work, encoder, wallet);
  return staged_wallet{.code = error_code::ok, .wallet = wallet};
}

staged_wallet stage_credit(rocksdb_unit_of_work_t& work,
                           encoder_t& encoder,
                           const account_id_t account_id,
                           const currency_id_t currency_id,
                           const amount_t amount) {
  auto wallet = load_wallet(work, encoder, account_id, currency_id);
  if (wallet.balance > std::numeric_limits<amount_t>::max() - amount) {
    return staged_wallet{.code = error_code::balance_overflow,
                         .wallet = wallet};
  }
  wallet.balance += amount;
  store_wallet(work, encoder, wallet);
  return staged_wallet{.code = error_code::ok, .wallet = wallet};
}

// Take the locks of every wallet an operation touches up front, in key order.
void lock_wallets(rocksdb_unit_of_work_t& work,
                  encoder_t& encoder,
                  std::vector<bytes_t> wallet_keys) {
  work.get_for_update<wallet_state_t>(encoder, wallet_keys);
}

audit_event_t make_event(const audit_event_kind_t kind,
                         const account_id_t actor_account_id,
                         const currency_id_t currency_id,
                         const amount_t amount) {
  return audit_event_t{.kind = kind,
                       .actor_account_id = actor_account_id,
                       .currency_id = currency_id,
                       .amount = amount,
                       .timestamp = now_milliseconds()};
}

}  // namespace

namespace guildbank::ledger {

ledger::ledger(guildbank::storage::rocksdb_storage_t& storage,
               const guildbank::currency::registry& registry,
               const guildbank::exchange::engine& engine,
               guildbank::audit::queue& audit)
    : storage_{storage}, registry_{registry}, engine_{engine}, audit_{audit} {}

operation_result<wallet_state_t> ledger::mint(const account_id_t account_id,
                                              const currency_id_t currency_id,
                                              const amount_t amount) {
  if (amount == 0) {
    return reject<wallet_state_t>(error_code::invalid_amount,
                                  "mint amount must be positive");
  }
  auto encoder = encoder_t{};
  try {
    if (!registry_.find_currency(currency_id)) {
      return reject<wallet_state_t>(error_code::currency_not_found,
                                    "currency does not exist");
    }
    if (!account_exists(account_id)) {
      return reject<wallet_state_t>(error_code::account_not_found,
                                    "account does not exist");
    }

    auto work = storage_.begin();
    auto staged = stage_credit(work, encoder, account_id, currency_id, amount);
    if (staged.code != error_code::ok) {
      return reject<wallet_state_t>(staged.code, "mint would overflow balance");
    }
    work.commit();

    audit_.enqueue(
        make_event(audit_event_kind_t::mint, account_id, currency_id, amount));
    spdlog::debug("Minted {} of currency {} to account {}", amount, currency_id,
                  account_id);
    return make_success(staged.wallet);
  } catch (const storage_unavailable& ex) {
    return make_failure<wallet_state_t>(error_code::storage_unavailable,
                                        ex.what());
  }
}

operation_result<wallet_state_t> ledger::burn(const account_id_t account_id,
                                              const currency_id_t currency_id,
                                              const amount_t amount) {
  if (amount == 0) {
    return reject<wallet_state_t>(error_code::invalid_amount,
                                  "burn amount must be positive");
  }
  auto encoder = encoder_t{};
  try {
    if (!registry_.find_currency(currency_id)) {
      return reject<wallet_state_t>(error_code::currency_not_found,
                                    "currency does not exist");
    }

    auto work = storage_.begin();
    auto staged = stage_debit(work, encoder, account_id, currency_id, amount);
    if (staged.code != error_code::ok) {
      return reject<wallet_state_t>(
          staged.code, "balance " + std::to_string(staged.wallet.balance) +
                           " is below " + std::to_string(amount));
    }
    work.commit();

    audit_.enqueue(
        make_event(audit_event_kind_t::burn, account_id, currency_id, amount));
    spdlog::debug("Burned {} of currency {} from account {}", amount,
                  currency_id, account_id);
    return make_success(staged.wallet);
  } catch (const storage_unavailable& ex) {
    return make_failure<wallet_state_t>(error_code::storage_unavailable,
                                        ex.what());
  }
}

operation_result<transfer_receipt> ledger::transfer(
    const account_id_t from_account_id,
    const account_id_t to_account_id,
    const currency_id_t currency_id,
    const amount_t amount) {
  if (amount == 0) {
    return reject<transfer_receipt>(error_code::invalid_amount,
                                    "transfer amount must be positive");
  }
  if (from_account_id == to_account_id) {
    return reject<transfer_receipt>(error_code::self_transfer,
                                    "sender and receiver are the same account");
  }
  auto encoder = encoder_t{};
  try {
    if (!registry_.find_currency(currency_id)) {
      return reject<transfer_receipt>(error_code::currency_not_found,
                                      "currency does not exist");
    }
    if (!account_exists(to_account_id)) {
      return reject<transfer_receipt>(error_code::account_not_found,
                                      "receiving account does not exist");
    }

    auto work = storage_.begin();
    lock_wallets(work, encoder,
                 {key::make_wallet_key(from_account_id, currency_id),
                  key::make_wallet_key(to_account_id, currency_id)});
    auto debited =
        stage_debit(work, encoder, from_account_id, currency_id, amount);
    if (debited.code != error_code::ok) {
      return reject<transfer_receipt>(
          debited.code, "balance " + std::to_string(debited.wallet.balance) +
                            " is below " + std::to_string(amount));
    }
    auto credited =
        stage_credit(work, encoder, to_account_id, currency_id, amount);
    if (credited.code != error_code::ok) {
      return reject<transfer_receipt>(credited.code,
                                      "transfer would overflow receiver");
    }
    work.commit();

    auto event = make_event(audit_event_kind_t::transfer, from_account_id,
                            currency_id, amount);
    event.counterpart_account_id = to_account_id;
    audit_.enqueue(std::move(event));
    spdlog::debug("Transferred {} of currency {} from {} to {}", amount,
                  currency_id, from_account_id, to_account_id);
    return make_success(
        transfer_receipt{.from = debited.wallet, .to = credited.wallet});
  } catch (const storage_unavailable& ex) {
    return make_failure<transfer_receipt>(error_code::storage_unavailable,
                                          ex.what());
  }
}

operation_result<exchange_receipt> ledger::exchange(
    const account_id_t account_id,
    const currency_id_t from_currency_id,
    const currency_id_t to_currency_id,
    const amount_t amount) {
  if (amount == 0) {
    return reject<exchange_receipt>(error_code::invalid_amount,
                                    "exchange amount must be positive");
  }
  auto encoder = encoder_t{};
  try {
    auto from_currency = registry_.find_currency(from_currency_id);
    auto to_currency = registry_.find_currency(to_currency_id);
    if (!from_currency || !to_currency) {
      return reject<exchange_receipt>(error_code::currency_not_found,
                                      "currency does not exist");
    }
    auto rate = std::optional<rate_t>{};
    if (from_currency->group_id == to_currency->group_id) {
      rate = engine_.rate_for(from_currency->group_id, from_currency_id,
                              to_currency_id);
    }
    if (!rate) {
      return reject<exchange_receipt>(
          error_code::rate_not_found,
          "no rate from " + std::to_string(from_currency_id) + " to " +
              std::to_string(to_currency_id));
    }
    auto converted = guildbank::exchange::engine::convert(amount, *rate);
    if (!converted) {
      return reject<exchange_receipt>(error_code::balance_overflow,
                                      "converted amount is out of range");
    }

    auto work = storage_.begin();
    lock_wallets(work, encoder,
                 {key::make_wallet_key(account_id, from_currency_id),
                  key::make_wallet_key(account_id, to_currency_id)});
    auto debited =
        stage_debit(work, encoder, account_id, from_currency_id, amount);
    if (debited.code != error_code::ok) {
      return reject<exchange_receipt>(
          debited.code, "balance " + std::to_string(debited.wallet.balance) +
                            " is below " + std::to_string(amount));
    }
    auto destination = load_wallet(work, encoder, account_id, to_currency_id);
    if (*converted > 0) {
      auto credited =
          stage_credit(work, encoder, account_id, to_currency_id, *converted);
      if (credited.code != error_code::ok) {
        return reject<exchange_receipt>(credited.code,
                                        "exchange would overflow balance");
      }
      destination = credited.wallet;
    }
    work.commit();

    auto event = make_event(audit_event_kind_t::exchange, account_id,
                            from_currency_id, amount);
    event.quote_currency_id = to_currency_id;
    event.quote_amount = *converted;
    audit_.enqueue(std::move(event));
    spdlog::debug("Account {} exchanged {} of {} into {} of {} at {}",
                  account_id, amount, from_currency_id, *converted,
                  to_currency_id, to_string(*rate));
    return make_success(exchange_receipt{.rate = *rate,
                                         .debited = amount,
                                         .credited = *converted,
                                         .source = debited.wallet,
                                         .destination = destination});
  } catch (const storage_unavailable& ex) {
    return make_failure<exchange_receipt>(error_code::storage_unavailable,
                                          ex.what());
  }
}

std::map<currency_id_t, amount_t> ledger::balance_of(
    const account_id_t account_id) const {
  auto encoder = encoder_t{};
  auto balances = std::map<currency_id_t, amount_t>{};
  for (const auto& [entry_key, value] : storage_.list_by_prefix(
           make_bytes_view(key::make_wallet_prefix(account_id)))) {
    auto wallet =
        encoder.decode<wallet_state_t>(bytes_view_t{value.data(), value.size()});
    balances.emplace(wallet.currency_id, wallet.balance);
  }
  return balances;
}

amount_t ledger::balance_of(const account_id_t account_id,
                            const currency_id_t currency_id) const {
  auto encoder = encoder_t{};
  auto wallet = storage_.get<wallet_state_t>(
      encoder, make_bytes_view(key::make_wallet_key(account_id, currency_id)));
  return wallet ? wallet->balance : 0;
}

std::vector<wallet_state_t> ledger::wallets() const {
  auto encoder = encoder_t{};
  auto result = std::vector<wallet_state_t>{};
  for (const auto& [entry_key, value] :
       storage_.list_by_prefix(make_bytes_view(key::make_wallet_prefix()))) {
    result.push_back(
        encoder.decode<wallet_state_t>(bytes_view_t{value.data(), value.size()}));
  }
  return result;
}

error_code ledger::debit(rocksdb_unit_of_work_t& work,
                         const account_id_t account_id,
                         const currency_id_t currency_id,
                         const amount_t amount) const {
  if (amount == 0) {
    return error_code::invalid_amount;
  }
  auto encoder = encoder_t{};
  return stage_debit(work, encoder, account_id, currency_id, amount).code;
}

error_code ledger::credit(rocksdb_unit_of_work_t& work,
                          const account_id_t account_id,
                          const currency_id_t currency_id,
                          const amount_t amount) const {
  if (amount == 0) {
    return error_code::invalid_amount;
  }
  auto encoder = encoder_t{};
  return stage_credit(work, encoder, account_id, currency_id, amount).code;
}

bool ledger::account_exists(const account_id_t account_id) const {
  auto encoder = encoder_t{};
  return storage_
      .get<account_state_t>(encoder,
                            make_bytes_view(key::make_account_key(account_id)))
      .has_value();
}

}  // namespace guildbank::ledger
