#pragma once
#include <guildbank/schema/primitives.hpp>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace guildbank::storage {

using key_value_entry_t =
    std::pair<guildbank::schema::bytes_t, guildbank::schema::bytes_t>;

/// Transient storage fault: lock timeout, deadlock, I/O error or a failed
/// commit. Nothing staged by the failing unit of work is retained.
class storage_unavailable final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Atomic transaction over the store: every staged write commits together
/// or none does. Destroying an uncommitted unit of work rolls it back.
template <typename Library>
class unit_of_work {
 public:
  /// Decode the value at key and hold an exclusive lock on the key until the
  /// unit of work finishes. Absent keys are locked as well.
  template <typename T, typename Encoder>
  std::optional<T> get_for_update(Encoder& encoder,
                                  const guildbank::schema::bytes_view_t& key);

  /// Lock several keys in byte order; results follow the order of `keys`.
  template <typename T, typename Encoder>
  std::vector<std::optional<T>> get_for_update(
      Encoder& encoder,
      const std::vector<guildbank::schema::bytes_t>& keys);

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const guildbank::schema::bytes_view_t& key,
           const T& value);

  void commit();
  void rollback();
};

template <typename Library>
struct storage {
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const guildbank::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const guildbank::schema::bytes_view_t& prefix) const;

  void write_entries(const std::vector<key_value_entry_t>& entries) const;

  unit_of_work<Library> begin() const;
};

template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace guildbank::storage
