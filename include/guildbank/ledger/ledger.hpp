#pragma once

#include <guildbank/audit/queue.hpp>
#include <guildbank/currency/registry.hpp>
#include <guildbank/exchange/engine.hpp>
#include <guildbank/schema/error_code.hpp>
#include <guildbank/schema/operation_result.hpp>
#include <guildbank/schema/wallet_state.hpp>
#include <guildbank/storage/rocksdb/storage.hpp>
#include <map>
#include <vector>

namespace guildbank::ledger {

struct transfer_receipt final {
  guildbank::schema::wallet_state_t from;
  guildbank::schema::wallet_state_t to;
};

struct exchange_receipt final {
  guildbank::schema::rate_t rate;
  guildbank::schema::amount_t debited{};
  // floor(debited * rate); the fractional remainder is not credited.
  guildbank::schema::amount_t credited{};
  guildbank::schema::wallet_state_t source;
  guildbank::schema::wallet_state_t destination;
};

/// Sole owner of wallet balances. Every operation locks the wallet rows it
/// touches in key order and commits them in one unit of work. Audit events
/// are enqueued only after a successful commit.
class ledger final {
 public:
  ledger(guildbank::storage::rocksdb_storage_t& storage,
         const guildbank::currency::registry& registry,
         const guildbank::exchange::engine& engine,
         guildbank::audit::queue& audit);

  /// The account must already exist (identity::resolver creates accounts on
  /// first contact); an unknown id is account_not_found. The wallet is
  /// created here if absent.
  guildbank::schema::operation_result<guildbank::schema::wallet_state_t> mint(
      guildbank::schema::account_id_t account_id,
      guildbank::schema::currency_id_t currency_id,
      guildbank::schema::amount_t amount);

  guildbank::schema::operation_result<guildbank::schema::wallet_state_t> burn(
      guildbank::schema::account_id_t account_id,
      guildbank::schema::currency_id_t currency_id,
      guildbank::schema::amount_t amount);

  guildbank::schema::operation_result<transfer_receipt> transfer(
      guildbank::schema::account_id_t from_account_id,
      guildbank::schema::account_id_t to_account_id,
      guildbank::schema::currency_id_t currency_id,
      guildbank::schema::amount_t amount);

  /// Convert within one group using the configured from -> to rate.
  guildbank::schema::operation_result<exchange_receipt> exchange(
      guildbank::schema::account_id_t account_id,
      guildbank::schema::currency_id_t from_currency_id,
      guildbank::schema::currency_id_t to_currency_id,
      guildbank::schema::amount_t amount);

  std::map<guildbank::schema::currency_id_t, guildbank::schema::amount_t>
  balance_of(guildbank::schema::account_id_t account_id) const;
  guildbank::schema::amount_t balance_of(
      guildbank::schema::account_id_t account_id,
      guildbank::schema::currency_id_t currency_id) const;

  std::vector<guildbank::schema::wallet_state_t> wallets() const;

  /// Stage a debit into a caller-owned unit of work. Nothing is staged
  /// unless the result is error_code::ok.
  guildbank::schema::error_code debit(
      guildbank::storage::rocksdb_unit_of_work_t& work,
      guildbank::schema::account_id_t account_id,
      guildbank::schema::currency_id_t currency_id,
      guildbank::schema::amount_t amount) const;

  guildbank::schema::error_code credit(
      guildbank::storage::rocksdb_unit_of_work_t& work,
      guildbank::schema::account_id_t account_id,
      guildbank::schema::currency_id_t currency_id,
      guildbank::schema::amount_t amount) const;

 private:
  bool account_exists(guildbank::schema::account_id_t account_id) const;

  guildbank::storage::rocksdb_storage_t& storage_;
  const guildbank::currency::registry& registry_;
  const guildbank::exchange::engine& engine_;
  guildbank::audit::queue& audit_;
};

}  // namespace guildbank::ledger
