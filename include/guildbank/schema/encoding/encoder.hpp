#pragma once
#include <guildbank/schema/primitives.hpp>
#include <optional>
#include <span>

namespace guildbank::schema::encoding {

// Build-time selection of the record codec. Storage, key construction and
// audit hashing are all written against this template so the wire format
// can be swapped by changing the tag.
template <typename Library>
struct encoder {
  template <typename T>
  guildbank::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, guildbank::schema::bytes_t& out);

  template <typename T>
  T decode(const guildbank::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const guildbank::schema::bytes_view_t& bytes);
};

}  // namespace guildbank::schema::encoding
