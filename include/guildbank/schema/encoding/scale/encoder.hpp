#pragma once
#include <guildbank/common/critical.hpp>
#include <guildbank/schema/account_state.hpp>
#include <guildbank/schema/audit_event.hpp>
#include <guildbank/schema/bank_note.hpp>
#include <guildbank/schema/currency_state.hpp>
#include <guildbank/schema/encoding/encoder.hpp>
#include <guildbank/schema/encoding/scale/audit_event_kind.hpp>
#include <guildbank/schema/encoding/scale/group_kind.hpp>
#include <guildbank/schema/exchange_rate.hpp>
#include <guildbank/schema/group_state.hpp>
#include <guildbank/schema/guild_membership.hpp>
#include <guildbank/schema/guild_state.hpp>
#include <guildbank/schema/wallet_state.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace guildbank::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  guildbank::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, guildbank::schema::bytes_t& out);

  template <typename T>
  T decode(const guildbank::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const guildbank::schema::bytes_view_t& bytes);
};

template <typename T>
guildbank::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    guildbank::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        guildbank::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const guildbank::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    guildbank::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const guildbank::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace guildbank::schema::encoding
