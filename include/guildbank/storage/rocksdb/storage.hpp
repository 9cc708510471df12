#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>
#include <guildbank/common/critical.hpp>
#include <guildbank/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <numeric>
#include <string>
#include <string_view>

namespace guildbank::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const guildbank::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline guildbank::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline guildbank::schema::bytes_view_t to_bytes_view(const std::string& raw) {
  return guildbank::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(raw.data()), raw.size()};
}

[[noreturn]] inline void unavailable(const std::string_view what,
                                     const ROCKSDB_NAMESPACE::Status& status) {
  spdlog::warn("RocksDB {} failed: {}", what, status.ToString());
  throw storage_unavailable{std::string{what} + ": " + status.ToString()};
}

template <typename T, typename Encoder>
T decode_or_die(Encoder& encoder, const std::string& raw) {
  auto decoded = encoder.template try_decode<T>(detail::to_bytes_view(raw));
  if (!decoded.has_value()) {
    guildbank::common::critical("corrupted record in RocksDB");
  }
  return std::move(decoded.value());
}

}  // namespace detail

struct rocksdb_storage_tag {};

/// Runs before every commit or batch write; a non-OK status vetoes it.
using commit_hook_t = std::function<ROCKSDB_NAMESPACE::Status()>;

template <>
class unit_of_work<rocksdb_storage_tag> final {
 public:
  unit_of_work(std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> transaction,
               commit_hook_t commit_hook)
      : transaction_{std::move(transaction)},
        commit_hook_{std::move(commit_hook)} {}

  unit_of_work(const unit_of_work&) = delete;
  unit_of_work& operator=(const unit_of_work&) = delete;
  unit_of_work(unit_of_work&&) = delete;
  unit_of_work& operator=(unit_of_work&&) = delete;

  ~unit_of_work() {
    if (!finished_) {
      rollback();
    }
  }

  template <typename T, typename Encoder>
  std::optional<T> get_for_update(Encoder& encoder,
                                  const guildbank::schema::bytes_view_t& key);

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

 private:
  std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> transaction_;
  commit_hook_t commit_hook_;
  bool finished_{false};
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB> database;
  commit_hook_t commit_hook;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const guildbank::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const guildbank::schema::bytes_view_t& prefix) const;
  void write_entries(const std::vector<key_value_entry_t>& entries) const;
  unit_of_work<rocksdb_storage_tag> begin() const;

  void set_commit_hook(commit_hook_t hook) { commit_hook = std::move(hook); }
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

using rocksdb_storage_t = storage<rocksdb_storage_tag>;
using rocksdb_unit_of_work_t = unit_of_work<rocksdb_storage_tag>;

template <typename T, typename Encoder>
std::optional<T> unit_of_work<rocksdb_storage_tag>::get_for_update(
    Encoder& encoder,
    const guildbank::schema::bytes_view_t& key) {
  auto value = std::string{};
  auto status = transaction_->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                           detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    detail::unavailable("GetForUpdate", status);
  }
  return detail::decode_or_die<T>(encoder, value);
}

template <typename T, typename Encoder>
std::vector<std::optional<T>> unit_of_work<rocksdb_storage_tag>::get_for_update(
    Encoder& encoder,
    const std::vector<guildbank::schema::bytes_t>& keys) {
  auto order = std::vector<std::size_t>(keys.size());
  std::iota(std::begin(order), std::end(order), std::size_t{0});
  std::ranges::sort(order, [&](const std::size_t lhs, const std::size_t rhs) {
    return keys[lhs] < keys[rhs];
  });

  auto values = std::vector<std::optional<T>>(keys.size());
  for (const auto index : order) {
    values[index] = get_for_update<T>(
        encoder,
        guildbank::schema::bytes_view_t{keys[index].data(), keys[index].size()});
  }
  return values;
}

template <typename T, typename Encoder>
void unit_of_work<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const guildbank::schema::bytes_view_t& key,
    const T& value) {
  auto encoded_value = encoder.encode(value);
  auto status = transaction_->Put(
      detail::to_slice(key),
      detail::to_slice(guildbank::schema::bytes_view_t{encoded_value.data(),
                                                       encoded_value.size()}));
  if (!status.ok()) {
    detail::unavailable("Put", status);
  }
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const guildbank::schema::bytes_view_t& key) const {
  if (!database) {
    guildbank::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    detail::unavailable("Get", status);
  }
  return detail::decode_or_die<T>(encoder, value);
}

}  // namespace guildbank::storage
