#pragma once

#include <guildbank/audit/queue.hpp>
#include <guildbank/currency/registry.hpp>
#include <guildbank/exchange/engine.hpp>
#include <guildbank/identity/resolver.hpp>
#include <guildbank/leaderboard/aggregator.hpp>
#include <guildbank/ledger/ledger.hpp>
#include <guildbank/notes/bank_note_service.hpp>
#include <guildbank/schema/operation_result.hpp>
#include <guildbank/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace guildbank::service {

struct balance_line final {
  guildbank::schema::currency_state_t currency;
  guildbank::schema::amount_t balance{};
};

/// Entry point for the chat layer. Wires every component over one store and
/// speaks in external guild and user ids and currency display names. An
/// omitted currency means the primary currency of the guild's single group.
class economy final {
 public:
  economy(guildbank::storage::rocksdb_storage_t& storage,
          guildbank::schema::bytes_t note_secret,
          guildbank::audit::alert_handler_t alert_handler = {});

  economy(const economy&) = delete;
  economy& operator=(const economy&) = delete;

  guildbank::schema::operation_result<guildbank::schema::guild_state_t>
  onboard_guild(std::string_view guild);

  guildbank::schema::operation_result<guildbank::schema::currency_state_t>
  create_currency(std::string_view guild, std::string_view display_name);

  guildbank::schema::operation_result<guildbank::schema::currency_state_t>
  set_primary_currency(std::string_view guild, std::string_view display_name);

  /// rate is decimal text, e.g. "1.5".
  guildbank::schema::operation_result<guildbank::schema::exchange_rate_t>
  set_exchange_rate(std::string_view guild,
                    std::string_view base_currency,
                    std::string_view quote_currency,
                    std::string_view rate);

  guildbank::schema::operation_result<guildbank::schema::wallet_state_t> grant(
      std::string_view guild,
      std::string_view user,
      guildbank::schema::amount_t amount,
      std::optional<std::string_view> currency = std::nullopt);

  guildbank::schema::operation_result<guildbank::schema::wallet_state_t> take(
      std::string_view guild,
      std::string_view user,
      guildbank::schema::amount_t amount,
      std::optional<std::string_view> currency = std::nullopt);

  guildbank::schema::operation_result<guildbank::ledger::transfer_receipt> pay(
      std::string_view guild,
      std::string_view from_user,
      std::string_view to_user,
      guildbank::schema::amount_t amount,
      std::optional<std::string_view> currency = std::nullopt);

  guildbank::schema::operation_result<guildbank::ledger::exchange_receipt>
  convert(std::string_view guild,
          std::string_view user,
          std::string_view from_currency,
          std::string_view to_currency,
          guildbank::schema::amount_t amount);

  guildbank::schema::operation_result<std::vector<balance_line>> balances(
      std::string_view guild,
      std::string_view user);

  guildbank::schema::operation_result<guildbank::notes::issued_note>
  issue_note(std::string_view guild,
             std::string_view issuer,
             std::string_view recipient,
             guildbank::schema::amount_t amount,
             std::optional<std::string_view> currency = std::nullopt);

  guildbank::schema::operation_result<guildbank::notes::redemption>
  redeem_note(std::string_view redeemer, std::string_view token);

  guildbank::schema::operation_result<guildbank::leaderboard::standings>
  leaderboard(std::string_view guild,
              std::optional<std::string_view> currency = std::nullopt,
              std::size_t limit = guildbank::leaderboard::kDefaultLimit) const;

  guildbank::audit::flush_result flush_audit(std::size_t max_batch_size);

  guildbank::identity::resolver& resolver() { return resolver_; }
  guildbank::currency::registry& registry() { return registry_; }
  guildbank::ledger::ledger& ledger() { return ledger_; }
  guildbank::notes::bank_note_service& notes() { return notes_; }
  guildbank::audit::queue& audit_queue() { return audit_; }

 private:
  std::optional<guildbank::schema::group_id_t> single_group_of(
      std::string_view guild) const;
  guildbank::schema::operation_result<guildbank::schema::currency_state_t>
  resolve_currency(std::string_view guild,
                   std::optional<std::string_view> currency) const;

  guildbank::identity::resolver resolver_;
  guildbank::currency::registry registry_;
  guildbank::exchange::engine engine_;
  guildbank::audit::queue audit_;
  guildbank::ledger::ledger ledger_;
  guildbank::notes::bank_note_service notes_;
  guildbank::leaderboard::aggregator aggregator_;
};

}  // namespace guildbank::service
