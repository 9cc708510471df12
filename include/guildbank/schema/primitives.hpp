#pragma once
#include <array>
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace guildbank::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = uint64_t;
using group_id_t = uint64_t;
using guild_id_t = uint64_t;
using currency_id_t = uint64_t;
using note_id_t = hash32_t;
using amount_t = uint64_t;
using rate_t = boost::multiprecision::cpp_dec_float_50;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
std::optional<hash32_t> try_make_hash32(const std::string_view hex);

/// RFC 4648 section 5 alphabet, no padding.
std::string to_base64url(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64url(const std::string_view encoded);

/// Parse a decimal rate such as "1.5". Rejects anything that is not a plain
/// non-negative decimal number.
std::optional<rate_t> try_make_rate(const std::string_view text);
std::string to_string(const rate_t& rate);

timestamp_milliseconds_t now_milliseconds();

}  // namespace guildbank::schema
