#include <gtest/gtest.h>
#include <guildbank/schema/encoding/scale/encoder.hpp>
#include <guildbank/schema/key/keys.hpp>
#include <guildbank/schema/wallet_state.hpp>
#include <guildbank/storage/rocksdb/storage.hpp>
#include <guildbank/storage/sequence.hpp>
#include <guildbank/testing/common.hpp>

#include <string>
#include <vector>

namespace {

using encoder_t = guildbank::schema::encoding::scale_encoder_t;
using guildbank::schema::make_bytes_view;
using guildbank::schema::wallet_state_t;

class storage_test : public ::testing::Test {
 protected:
  storage_test()
      : db_path_{guildbank::testing::make_db_path("guildbank_storage")},
        storage_{guildbank::storage::make_storage<
            guildbank::storage::rocksdb_storage_tag>(db_path_)} {}

  ~storage_test() override {
    storage_.database.reset();
    guildbank::testing::remove_path(db_path_);
  }

  std::string db_path_;
  guildbank::storage::rocksdb_storage_t storage_;
  encoder_t encoder_;
};

wallet_state_t make_wallet(const uint64_t account_id, const uint64_t balance) {
  return wallet_state_t{
      .account_id = account_id, .currency_id = 1, .balance = balance};
}

}  // namespace

TEST_F(storage_test, committed_unit_of_work_is_visible) {
  auto key = guildbank::schema::key::make_wallet_key(1, 1);
  {
    auto work = storage_.begin();
    work.put(encoder_, make_bytes_view(key), make_wallet(1, 10));
    work.commit();
  }
  auto loaded = storage_.get<wallet_state_t>(encoder_, make_bytes_view(key));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->balance, 10u);
}

TEST_F(storage_test, abandoned_unit_of_work_rolls_back) {
  auto key = guildbank::schema::key::make_wallet_key(1, 1);
  {
    auto work = storage_.begin();
    work.put(encoder_, make_bytes_view(key), make_wallet(1, 10));
  }
  EXPECT_FALSE(
      storage_.get<wallet_state_t>(encoder_, make_bytes_view(key)).has_value());
}

TEST_F(storage_test, vetoed_commit_throws_and_discards_every_write) {
  auto first = guildbank::schema::key::make_wallet_key(1, 1);
  auto second = guildbank::schema::key::make_wallet_key(2, 1);
  storage_.set_commit_hook(
      []() { return ROCKSDB_NAMESPACE::Status::IOError("disk gone"); });
  {
    auto work = storage_.begin();
    work.put(encoder_, make_bytes_view(first), make_wallet(1, 10));
    work.put(encoder_, make_bytes_view(second), make_wallet(2, 20));
    EXPECT_THROW(work.commit(), guildbank::storage::storage_unavailable);
  }
  EXPECT_FALSE(
      storage_.get<wallet_state_t>(encoder_, make_bytes_view(first)).has_value());
  EXPECT_FALSE(storage_.get<wallet_state_t>(encoder_, make_bytes_view(second))
                   .has_value());
}

TEST_F(storage_test, get_for_update_locks_several_keys_in_any_order) {
  auto first = guildbank::schema::key::make_wallet_key(1, 1);
  auto second = guildbank::schema::key::make_wallet_key(2, 1);
  {
    auto work = storage_.begin();
    work.put(encoder_, make_bytes_view(second), make_wallet(2, 20));
    work.commit();
  }
  auto work = storage_.begin();
  auto values =
      work.get_for_update<wallet_state_t>(encoder_, {second, first});
  ASSERT_EQ(values.size(), 2u);
  ASSERT_TRUE(values[0].has_value());
  EXPECT_EQ(values[0]->balance, 20u);
  EXPECT_FALSE(values[1].has_value());
  work.rollback();
}

TEST_F(storage_test, list_by_prefix_returns_rows_in_id_order) {
  {
    auto work = storage_.begin();
    for (const auto account_id : {300u, 2u, 17u}) {
      work.put(encoder_,
               make_bytes_view(
                   guildbank::schema::key::make_wallet_key(account_id, 1)),
               make_wallet(account_id, account_id));
    }
    work.put(encoder_,
             make_bytes_view(guildbank::schema::key::make_account_key(1)),
             uint64_t{1});
    work.commit();
  }
  auto entries = storage_.list_by_prefix(
      make_bytes_view(guildbank::schema::key::make_wallet_prefix()));
  ASSERT_EQ(entries.size(), 3u);
  auto ids = std::vector<uint64_t>{};
  for (const auto& [key, value] : entries) {
    ids.push_back(encoder_
                      .decode<wallet_state_t>(
                          guildbank::schema::bytes_view_t{value.data(),
                                                          value.size()})
                      .account_id);
  }
  EXPECT_EQ(ids, (std::vector<uint64_t>{2, 17, 300}));
}

TEST_F(storage_test, sequences_start_at_one_and_survive_commits) {
  {
    auto work = storage_.begin();
    EXPECT_EQ(guildbank::storage::next_sequence(
                  work, encoder_, guildbank::storage::kAccountSequence),
              1u);
    EXPECT_EQ(guildbank::storage::next_sequence(
                  work, encoder_, guildbank::storage::kAccountSequence),
              2u);
    work.commit();
  }
  {
    auto work = storage_.begin();
    EXPECT_EQ(guildbank::storage::next_sequence(
                  work, encoder_, guildbank::storage::kAccountSequence),
              3u);
    EXPECT_EQ(guildbank::storage::next_sequence(
                  work, encoder_, guildbank::storage::kNoteSequence),
              1u);
  }
  auto work = storage_.begin();
  EXPECT_EQ(guildbank::storage::next_sequence(
                work, encoder_, guildbank::storage::kAccountSequence),
            3u);
}

TEST_F(storage_test, write_entries_honors_commit_hook) {
  auto entries = std::vector<guildbank::storage::key_value_entry_t>{
      {guildbank::schema::bytes_t{'a'}, guildbank::schema::bytes_t{'1'}}};
  storage_.set_commit_hook(
      []() { return ROCKSDB_NAMESPACE::Status::Busy("busy"); });
  EXPECT_THROW(storage_.write_entries(entries),
               guildbank::storage::storage_unavailable);
  storage_.set_commit_hook({});
  storage_.write_entries(entries);
  EXPECT_EQ(storage_
                .list_by_prefix(guildbank::schema::bytes_view_t{
                    entries[0].first.data(), entries[0].first.size()})
                .size(),
            1u);
}
