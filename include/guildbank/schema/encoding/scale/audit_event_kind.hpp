#pragma once

#include <guildbank/schema/audit_event_kind.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    guildbank::schema,
    audit_event_kind_t,
    guildbank::schema::audit_event_kind_t::mint,
    guildbank::schema::audit_event_kind_t::burn,
    guildbank::schema::audit_event_kind_t::exchange,
    guildbank::schema::audit_event_kind_t::transfer,
    guildbank::schema::audit_event_kind_t::note_issue,
    guildbank::schema::audit_event_kind_t::note_redeem)
