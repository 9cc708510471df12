#include <spdlog/spdlog.h>
#include <guildbank/blake3/hash.hpp>
#include <guildbank/notes/bank_note_service.hpp>
#include <guildbank/schema/encoding/scale/encoder.hpp>
#include <guildbank/schema/key/builder.hpp>
#include <guildbank/schema/key/keys.hpp>
#include <guildbank/storage/sequence.hpp>
#include <utility>

using namespace guildbank::schema;

namespace {

using encoder_t = guildbank::schema::encoding::scale_encoder_t;
using guildbank::storage::storage_unavailable;

template <typename T>
operation_result<T> reject(const error_code code, std::string log) {
  spdlog::info("Bank note operation rejected ({}): {}", error_name(code), log);
  return make_failure<T>(code, std::move(log));
}

note_id_t make_note_id(const account_id_t issuer_account_id,
                       const uint64_t sequence,
                       const timestamp_milliseconds_t issued_at) {
  auto preimage = key::builder{}
                      .write(issuer_account_id)
                      .write(sequence)
                      .write(issued_at)
                      .data;
  return guildbank::blake3::hash(make_bytes_view(preimage));
}

}  // namespace

namespace guildbank::notes {

bank_note_service::bank_note_service(
    guildbank::storage::rocksdb_storage_t& storage,
    guildbank::identity::resolver& resolver,
    const guildbank::currency::registry& registry,
    const guildbank::ledger::ledger& ledger,
    guildbank::audit::queue& audit,
    token_codec codec)
    : storage_{storage},
      resolver_{resolver},
      registry_{registry},
      ledger_{ledger},
      audit_{audit},
      codec_{std::move(codec)} {}

operation_result<issued_note> bank_note_service::issue(
    const account_id_t issuer_account_id,
    const std::string_view recipient_external_id,
    const currency_id_t currency_id,
    const amount_t amount) {
  if (amount == 0) {
    return reject<issued_note>(error_code::invalid_amount,
                               "note amount must be positive");
  }
  auto encoder = encoder_t{};
  try {
    if (!registry_.find_currency(currency_id)) {
      return reject<issued_note>(error_code::currency_not_found,
                                 "currency does not exist");
    }
    if (!resolver_.find_account(issuer_account_id)) {
      return reject<issued_note>(error_code::account_not_found,
                                 "issuer account does not exist");
    }
    auto recipient = resolver_.resolve_account(recipient_external_id);
    if (!recipient.ok()) {
      return make_failure<issued_note>(recipient.code, recipient.log);
    }

    auto work = storage_.begin();
    auto debited = ledger_.debit(work, issuer_account_id, currency_id, amount);
    if (debited != error_code::ok) {
      return reject<issued_note>(debited, "issuer cannot cover the note");
    }

    const auto issued_at = now_milliseconds();
    const auto sequence = guildbank::storage::next_sequence(
        work, encoder, guildbank::storage::kNoteSequence);
    auto note = bank_note_t{
        .note_id = make_note_id(issuer_account_id, sequence, issued_at),
        .currency_id = currency_id,
        .amount = amount,
        .recipient_account_id = recipient.value->account_id,
        .issuer_account_id = issuer_account_id,
        .consumed = false,
        .issued_at = issued_at,
        .consumed_at = std::nullopt};
    work.put(encoder, make_bytes_view(key::make_note_key(note.note_id)), note);
    work.commit();

    auto token = codec_.sign(note_claims{
        .currency_id = currency_id,
        .amount = amount,
        .note_id = note.note_id,
        .recipient_id = std::string{recipient_external_id}});

    audit_.enqueue(audit_event_t{
        .kind = audit_event_kind_t::note_issue,
        .actor_account_id = issuer_account_id,
        .counterpart_account_id = note.recipient_account_id,
        .currency_id = currency_id,
        .amount = amount,
        .note_id = note.note_id,
        .timestamp = issued_at});
    spdlog::debug("Account {} issued note {} for {} of currency {}",
                  issuer_account_id, to_hex(note.note_id), amount,
                  currency_id);
    return make_success(issued_note{.note = note, .token = std::move(token)});
  } catch (const storage_unavailable& ex) {
    return make_failure<issued_note>(error_code::storage_unavailable,
                                     ex.what());
  }
}

operation_result<redemption> bank_note_service::redeem(
    const std::string_view redeemer_external_id,
    const std::string_view token) {
  auto claims = codec_.verify(token);
  if (!claims.ok()) {
    return reject<redemption>(claims.code, claims.log);
  }
  if (claims.value->recipient_id != redeemer_external_id) {
    return reject<redemption>(error_code::recipient_mismatch,
                              "note is bound to another recipient");
  }

  auto encoder = encoder_t{};
  try {
    auto redeemer = resolver_.resolve_account(redeemer_external_id);
    if (!redeemer.ok()) {
      return make_failure<redemption>(redeemer.code, redeemer.log);
    }

    auto work = storage_.begin();
    auto note_key = key::make_note_key(claims.value->note_id);
    auto note =
        work.get_for_update<bank_note_t>(encoder, make_bytes_view(note_key));
    if (!note) {
      return reject<redemption>(error_code::note_not_found,
                                "note " + to_hex(claims.value->note_id) +
                                    " does not exist");
    }
    if (note->recipient_account_id != redeemer.value->account_id) {
      return reject<redemption>(error_code::recipient_mismatch,
                                "note is bound to another account");
    }
    if (note->consumed) {
      return reject<redemption>(error_code::already_consumed,
                                "note " + to_hex(note->note_id) +
                                    " was already redeemed");
    }

    const auto now = now_milliseconds();
    note->consumed = true;
    note->consumed_at = now;
    work.put(encoder, make_bytes_view(note_key), *note);
    auto credited = ledger_.credit(work, redeemer.value->account_id,
                                   note->currency_id, note->amount);
    if (credited != error_code::ok) {
      return reject<redemption>(credited, "note would overflow balance");
    }
    work.commit();

    audit_.enqueue(audit_event_t{
        .kind = audit_event_kind_t::note_redeem,
        .actor_account_id = redeemer.value->account_id,
        .counterpart_account_id = note->issuer_account_id,
        .currency_id = note->currency_id,
        .amount = note->amount,
        .note_id = note->note_id,
        .timestamp = now});
    spdlog::debug("Account {} redeemed note {}", redeemer.value->account_id,
                  to_hex(note->note_id));
    return make_success(
        redemption{.note = *note, .credited = note->amount});
  } catch (const storage_unavailable& ex) {
    return make_failure<redemption>(error_code::storage_unavailable,
                                    ex.what());
  }
}

std::optional<bank_note_t> bank_note_service::find_note(
    const note_id_t& note_id) const {
  auto encoder = encoder_t{};
  return storage_.get<bank_note_t>(
      encoder, make_bytes_view(key::make_note_key(note_id)));
}

}  // namespace guildbank::notes
