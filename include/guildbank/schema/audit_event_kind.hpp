#pragma once

#include <guildbank/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace guildbank::schema {

enum class audit_event_kind_t : uint8_t {
  mint = 0,
  burn = 1,
  exchange = 2,
  transfer = 3,
  note_issue = 4,
  note_redeem = 5,
};

inline constexpr auto kAuditEventKindNames =
    std::array<std::pair<std::string_view, audit_event_kind_t>, 6>{{
        {"mint", audit_event_kind_t::mint},
        {"burn", audit_event_kind_t::burn},
        {"exchange", audit_event_kind_t::exchange},
        {"transfer", audit_event_kind_t::transfer},
        {"note_issue", audit_event_kind_t::note_issue},
        {"note_redeem", audit_event_kind_t::note_redeem},
    }};

constexpr std::string_view kind_name(const audit_event_kind_t kind) {
  return to_string(kind, kAuditEventKindNames).value_or("unknown");
}

}  // namespace guildbank::schema
