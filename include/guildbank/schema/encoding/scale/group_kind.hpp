#pragma once

#include <guildbank/schema/group_kind.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(guildbank::schema,
                             group_kind_t,
                             guildbank::schema::group_kind_t::global,
                             guildbank::schema::group_kind_t::single,
                             guildbank::schema::group_kind_t::local)
