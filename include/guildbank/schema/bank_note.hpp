#pragma once
#include <guildbank/schema/primitives.hpp>
#include <optional>

namespace guildbank::schema {

template <uint16_t Version>
struct bank_note;

template <>
struct bank_note<1> final {
  uint16_t version{1};
  note_id_t note_id{};
  currency_id_t currency_id{};
  amount_t amount{};
  account_id_t recipient_account_id{};
  account_id_t issuer_account_id{};
  bool consumed{false};
  timestamp_milliseconds_t issued_at{};
  std::optional<timestamp_milliseconds_t> consumed_at;
};

using bank_note_t = bank_note<1>;

}  // namespace guildbank::schema
