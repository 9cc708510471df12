#pragma once

#include <guildbank/schema/primitives.hpp>
#include <cstddef>

namespace guildbank::crypto {

guildbank::schema::hash32_t hmac_sha256(
    const guildbank::schema::bytes_view_t& key,
    const guildbank::schema::bytes_view_t& message);

/// Constant-time byte comparison; false when the lengths differ.
bool equal(const guildbank::schema::bytes_view_t& lhs,
           const guildbank::schema::bytes_view_t& rhs);

guildbank::schema::bytes_t random_bytes(std::size_t size);

}  // namespace guildbank::crypto
