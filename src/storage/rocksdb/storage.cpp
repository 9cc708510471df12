#include <guildbank/common/critical.hpp>
#include <guildbank/storage/rocksdb/storage.hpp>

namespace guildbank::storage {

void unit_of_work<rocksdb_storage_tag>::commit() {
  if (finished_) {
    guildbank::common::critical("unit of work committed twice");
  }
  if (commit_hook_) {
    auto hook_status = commit_hook_();
    if (!hook_status.ok()) {
      rollback();
      detail::unavailable("Commit", hook_status);
    }
  }
  auto status = transaction_->Commit();
  if (!status.ok()) {
    rollback();
    detail::unavailable("Commit", status);
  }
  finished_ = true;
}

void unit_of_work<rocksdb_storage_tag>::rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  auto status = transaction_->Rollback();
  if (!status.ok()) {
    spdlog::error("Failed to roll back RocksDB transaction: {}",
                  status.ToString());
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const guildbank::schema::bytes_view_t& prefix) const {
  if (!database) {
    guildbank::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    detail::unavailable("Iterate", iterator->status());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::write_entries(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    guildbank::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        detail::to_slice(guildbank::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            guildbank::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      detail::unavailable("WriteBatch::Put", put_status);
    }
  }

  if (commit_hook) {
    auto hook_status = commit_hook();
    if (!hook_status.ok()) {
      detail::unavailable("Write", hook_status);
    }
  }
  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    detail::unavailable("Write", write_status);
  }
}

unit_of_work<rocksdb_storage_tag> storage<rocksdb_storage_tag>::begin() const {
  if (!database) {
    guildbank::common::critical("RocksDB database is not initialized");
  }
  auto transaction_options = ROCKSDB_NAMESPACE::TransactionOptions{};
  transaction_options.deadlock_detect = true;
  return unit_of_work<rocksdb_storage_tag>{
      std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{
          database->BeginTransaction(ROCKSDB_NAMESPACE::WriteOptions{},
                                     transaction_options)},
      commit_hook};
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  auto transaction_db_options = ROCKSDB_NAMESPACE::TransactionDBOptions{};

  ROCKSDB_NAMESPACE::TransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::TransactionDB::Open(
      options, transaction_db_options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    guildbank::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace guildbank::storage
