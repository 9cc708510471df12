#pragma once

#include <guildbank/schema/audit_event_kind.hpp>
#include <guildbank/schema/primitives.hpp>
#include <optional>

namespace guildbank::schema {

template <uint16_t Version>
struct audit_event;

template <>
struct audit_event<1> final {
  uint16_t version{1};
  // Assigned by the audit queue on enqueue.
  uint64_t event_id{};
  audit_event_kind_t kind{};
  account_id_t actor_account_id{};
  std::optional<account_id_t> counterpart_account_id;
  currency_id_t currency_id{};
  amount_t amount{};
  std::optional<currency_id_t> quote_currency_id;
  std::optional<amount_t> quote_amount;
  std::optional<note_id_t> note_id;
  timestamp_milliseconds_t timestamp{};
};

using audit_event_t = audit_event<1>;

}  // namespace guildbank::schema
