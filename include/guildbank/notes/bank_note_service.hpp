#pragma once

#include <guildbank/audit/queue.hpp>
#include <guildbank/currency/registry.hpp>
#include <guildbank/identity/resolver.hpp>
#include <guildbank/ledger/ledger.hpp>
#include <guildbank/notes/token.hpp>
#include <guildbank/schema/bank_note.hpp>
#include <guildbank/schema/operation_result.hpp>
#include <guildbank/storage/rocksdb/storage.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace guildbank::notes {

struct issued_note final {
  guildbank::schema::bank_note_t note;
  std::string token;
};

struct redemption final {
  guildbank::schema::bank_note_t note;
  guildbank::schema::amount_t credited{};
};

/// Single-use, recipient-bound bank notes. Issuing debits the issuer at once;
/// redemption locks the note row so at most one attempt commits.
class bank_note_service final {
 public:
  bank_note_service(guildbank::storage::rocksdb_storage_t& storage,
                    guildbank::identity::resolver& resolver,
                    const guildbank::currency::registry& registry,
                    const guildbank::ledger::ledger& ledger,
                    guildbank::audit::queue& audit,
                    token_codec codec);

  guildbank::schema::operation_result<issued_note> issue(
      guildbank::schema::account_id_t issuer_account_id,
      std::string_view recipient_external_id,
      guildbank::schema::currency_id_t currency_id,
      guildbank::schema::amount_t amount);

  /// Credit the note to the redeemer. Checks run in order: signature,
  /// recipient, note state.
  guildbank::schema::operation_result<redemption> redeem(
      std::string_view redeemer_external_id,
      std::string_view token);

  std::optional<guildbank::schema::bank_note_t> find_note(
      const guildbank::schema::note_id_t& note_id) const;

 private:
  guildbank::storage::rocksdb_storage_t& storage_;
  guildbank::identity::resolver& resolver_;
  const guildbank::currency::registry& registry_;
  const guildbank::ledger::ledger& ledger_;
  guildbank::audit::queue& audit_;
  token_codec codec_;
};

}  // namespace guildbank::notes
