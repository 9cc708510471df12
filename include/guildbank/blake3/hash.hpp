#pragma once
#include <guildbank/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace guildbank::blake3 {

guildbank::schema::hash32_t hash(const std::string_view& str);
guildbank::schema::hash32_t hash(const guildbank::schema::bytes_view_t& bytes);

}  // namespace guildbank::blake3
