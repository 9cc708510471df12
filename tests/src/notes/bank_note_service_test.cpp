#include <gtest/gtest.h>
#include <guildbank/schema/key/keys.hpp>
#include <guildbank/testing/economy_fixture.hpp>

#include <atomic>
#include <thread>
#include <vector>

using guildbank::schema::error_code;

namespace {

struct note_world final {
  explicit note_world(const std::string_view prefix) : fixture{prefix} {
    group_id = fixture.onboard("guild");
    gold = fixture.add_currency(group_id, "gold");
    issuer = fixture.account("issuer");
    EXPECT_TRUE(fixture.economy().ledger().mint(issuer, gold, 50).ok());
  }

  guildbank::notes::bank_note_service& notes() {
    return fixture.economy().notes();
  }
  guildbank::ledger::ledger& ledger() { return fixture.economy().ledger(); }

  guildbank::testing::economy_fixture fixture;
  guildbank::schema::group_id_t group_id{};
  guildbank::schema::currency_id_t gold{};
  guildbank::schema::account_id_t issuer{};
};

}  // namespace

TEST(bank_note_types, issuing_debits_issuer_immediately) {
  auto world = note_world{"guildbank_notes"};
  auto issued = world.notes().issue(world.issuer, "recipient", world.gold, 10);
  ASSERT_TRUE(issued.ok());
  EXPECT_FALSE(issued.value->token.empty());
  EXPECT_FALSE(issued.value->note.consumed);
  EXPECT_EQ(world.ledger().balance_of(world.issuer, world.gold), 40u);

  auto stored = world.notes().find_note(issued.value->note.note_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->amount, 10u);
  EXPECT_EQ(stored->issuer_account_id, world.issuer);
}

TEST(bank_note_types, issuing_beyond_balance_fails_without_note) {
  auto world = note_world{"guildbank_notes"};
  auto issued = world.notes().issue(world.issuer, "recipient", world.gold, 51);
  EXPECT_EQ(issued.code, error_code::insufficient_balance);
  EXPECT_EQ(world.ledger().balance_of(world.issuer, world.gold), 50u);
  EXPECT_EQ(world.notes().issue(world.issuer, "recipient", world.gold, 0).code,
            error_code::invalid_amount);
  EXPECT_EQ(world.notes().issue(world.issuer, "recipient", 404, 1).code,
            error_code::currency_not_found);
}

TEST(bank_note_types, note_redeems_exactly_once) {
  auto world = note_world{"guildbank_notes"};
  auto issued = world.notes().issue(world.issuer, "recipient", world.gold, 10);
  ASSERT_TRUE(issued.ok());
  auto recipient = world.fixture.account("recipient");

  auto redeemed = world.notes().redeem("recipient", issued.value->token);
  ASSERT_TRUE(redeemed.ok());
  EXPECT_EQ(redeemed.value->credited, 10u);
  EXPECT_TRUE(redeemed.value->note.consumed);
  EXPECT_EQ(world.ledger().balance_of(recipient, world.gold), 10u);

  auto again = world.notes().redeem("recipient", issued.value->token);
  EXPECT_EQ(again.code, error_code::already_consumed);
  EXPECT_EQ(world.ledger().balance_of(recipient, world.gold), 10u);
  EXPECT_TRUE(world.notes().find_note(issued.value->note.note_id)->consumed);
}

TEST(bank_note_types, only_the_named_recipient_can_redeem) {
  auto world = note_world{"guildbank_notes"};
  auto issued = world.notes().issue(world.issuer, "recipient", world.gold, 10);
  ASSERT_TRUE(issued.ok());

  auto stolen = world.notes().redeem("thief", issued.value->token);
  EXPECT_EQ(stolen.code, error_code::recipient_mismatch);
  EXPECT_FALSE(world.fixture.economy().resolver().find_account("thief"));
  EXPECT_FALSE(world.notes().find_note(issued.value->note.note_id)->consumed);
}

TEST(bank_note_types, tampered_token_is_never_redeemed) {
  auto world = note_world{"guildbank_notes"};
  auto issued = world.notes().issue(world.issuer, "recipient", world.gold, 10);
  ASSERT_TRUE(issued.ok());
  auto token = issued.value->token;
  auto first_dot = token.find('.');
  // Flip one bit of the first payload character.
  token[first_dot + 1] = token[first_dot + 1] == 'e' ? 'f' : 'e';

  auto redeemed = world.notes().redeem("recipient", token);
  EXPECT_EQ(redeemed.code, error_code::invalid_signature);
  EXPECT_FALSE(world.notes().find_note(issued.value->note.note_id)->consumed);
}

TEST(bank_note_types, failed_redemption_commit_leaves_note_redeemable) {
  auto world = note_world{"guildbank_notes"};
  auto issued = world.notes().issue(world.issuer, "recipient", world.gold, 10);
  ASSERT_TRUE(issued.ok());
  auto recipient = world.fixture.account("recipient");

  world.fixture.fail_storage();
  auto failed = world.notes().redeem("recipient", issued.value->token);
  world.fixture.restore_storage();
  EXPECT_EQ(failed.code, error_code::storage_unavailable);
  EXPECT_EQ(world.ledger().balance_of(recipient, world.gold), 0u);
  EXPECT_FALSE(world.notes().find_note(issued.value->note.note_id)->consumed);

  EXPECT_TRUE(world.notes().redeem("recipient", issued.value->token).ok());
  EXPECT_EQ(world.ledger().balance_of(recipient, world.gold), 10u);
}

TEST(bank_note_types, failed_issue_commit_keeps_balance_and_stores_no_note) {
  auto world = note_world{"guildbank_notes"};
  world.fixture.account("recipient");
  auto queued = world.fixture.economy().audit_queue().size();

  world.fixture.fail_storage();
  auto issued = world.notes().issue(world.issuer, "recipient", world.gold, 10);
  world.fixture.restore_storage();

  EXPECT_EQ(issued.code, error_code::storage_unavailable);
  EXPECT_EQ(world.ledger().balance_of(world.issuer, world.gold), 50u);
  EXPECT_TRUE(world.fixture.storage()
                  .list_by_prefix(guildbank::schema::make_bytes_view(
                      guildbank::schema::key::make_note_prefix()))
                  .empty());
  EXPECT_EQ(world.fixture.economy().audit_queue().size(), queued);
}

TEST(bank_note_types, concurrent_redemptions_credit_once) {
  auto world = note_world{"guildbank_notes"};
  auto issued = world.notes().issue(world.issuer, "recipient", world.gold, 10);
  ASSERT_TRUE(issued.ok());
  auto recipient = world.fixture.account("recipient");
  const auto token = issued.value->token;

  auto succeeded = std::atomic<int>{0};
  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      auto result = world.notes().redeem("recipient", token);
      if (result.ok()) {
        ++succeeded;
      } else {
        EXPECT_TRUE(result.code == error_code::already_consumed ||
                    result.code == error_code::storage_unavailable);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(succeeded.load(), 1);
  EXPECT_EQ(world.ledger().balance_of(recipient, world.gold), 10u);
}

TEST(bank_note_types, issue_and_redeem_are_audited) {
  auto world = note_world{"guildbank_notes"};
  auto& queue = world.fixture.economy().audit_queue();
  auto before = queue.size();
  auto issued = world.notes().issue(world.issuer, "recipient", world.gold, 10);
  ASSERT_TRUE(issued.ok());
  ASSERT_TRUE(world.notes().redeem("recipient", issued.value->token).ok());
  EXPECT_EQ(queue.size(), before + 2);
}
