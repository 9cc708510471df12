#pragma once
#include <guildbank/schema/key/keys.hpp>
#include <guildbank/storage/storage.hpp>
#include <cstdint>
#include <string_view>

namespace guildbank::storage {

inline constexpr auto kAccountSequence = std::string_view{"ACCOUNT"};
inline constexpr auto kGroupSequence = std::string_view{"GROUP"};
inline constexpr auto kGuildSequence = std::string_view{"GUILD"};
inline constexpr auto kCurrencySequence = std::string_view{"CURRENCY"};
inline constexpr auto kNoteSequence = std::string_view{"NOTE"};

/// Allocate the next id of a named sequence. The sequence row stays locked
/// until the unit of work finishes, so ids follow commit order and are never
/// handed out twice.
template <typename Library, typename Encoder>
uint64_t next_sequence(unit_of_work<Library>& work,
                       Encoder& encoder,
                       const std::string_view name) {
  auto key = guildbank::schema::key::make_sequence_key(name);
  auto key_view = guildbank::schema::bytes_view_t{key.data(), key.size()};
  auto current = work.template get_for_update<uint64_t>(encoder, key_view);
  auto next = current.value_or(0) + 1;
  work.put(encoder, key_view, next);
  return next;
}

}  // namespace guildbank::storage
