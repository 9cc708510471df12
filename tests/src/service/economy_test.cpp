#include <gtest/gtest.h>
#include <guildbank/audit/sink.hpp>
#include <guildbank/testing/economy_fixture.hpp>

#include <string>
#include <vector>

using guildbank::schema::amount_t;
using guildbank::schema::error_code;

namespace {

std::vector<std::pair<std::string, amount_t>> lines_of(
    const std::vector<guildbank::service::balance_line>& lines) {
  auto out = std::vector<std::pair<std::string, amount_t>>{};
  for (const auto& line : lines) {
    out.emplace_back(line.currency.display_name, line.balance);
  }
  return out;
}

}  // namespace

TEST(economy_types, unknown_guild_is_rejected) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_economy"};
  auto& economy = fixture.economy();
  EXPECT_EQ(economy.create_currency("ghost", "gold").code,
            error_code::guild_not_found);
  EXPECT_EQ(economy.grant("ghost", "alice", 5).code,
            error_code::guild_not_found);
  EXPECT_EQ(economy.balances("ghost", "alice").code,
            error_code::guild_not_found);
  EXPECT_EQ(economy.leaderboard("ghost").code, error_code::guild_not_found);
}

TEST(economy_types, onboarding_is_idempotent) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_economy"};
  auto first = fixture.economy().onboard_guild("guild");
  auto second = fixture.economy().onboard_guild("guild");
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(first.value->guild_id, second.value->guild_id);
  EXPECT_EQ(first.value->single_group_id, second.value->single_group_id);
}

TEST(economy_types, omitted_currency_means_primary) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_economy"};
  auto& economy = fixture.economy();
  economy.onboard_guild("guild");
  EXPECT_EQ(economy.grant("guild", "alice", 5).code,
            error_code::currency_not_found);

  ASSERT_TRUE(economy.create_currency("guild", "gold").ok());
  ASSERT_TRUE(economy.create_currency("guild", "gems").ok());
  EXPECT_EQ(economy.create_currency("guild", "gold").code,
            error_code::currency_exists);

  ASSERT_TRUE(economy.grant("guild", "alice", 5).ok());
  ASSERT_TRUE(economy.set_primary_currency("guild", "gems").ok());
  ASSERT_TRUE(economy.grant("guild", "alice", 7).ok());

  auto balances = economy.balances("guild", "alice");
  ASSERT_TRUE(balances.ok());
  EXPECT_EQ(lines_of(*balances.value),
            (std::vector<std::pair<std::string, amount_t>>{{"gold", 5},
                                                           {"gems", 7}}));
}

TEST(economy_types, grant_creates_account_and_wallet_on_first_use) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_economy"};
  auto& economy = fixture.economy();
  economy.onboard_guild("guild");
  economy.create_currency("guild", "gold");
  ASSERT_FALSE(economy.resolver().find_account("newcomer").has_value());

  auto granted = economy.grant("guild", "newcomer", 3);
  ASSERT_TRUE(granted.ok());
  auto account = economy.resolver().find_account("newcomer");
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(granted.value->account_id, account->account_id);
  EXPECT_EQ(granted.value->balance, 3u);
}

TEST(economy_types, unknown_user_has_zero_balances) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_economy"};
  auto& economy = fixture.economy();
  economy.onboard_guild("guild");
  economy.create_currency("guild", "gold");

  auto balances = economy.balances("guild", "nobody");
  ASSERT_TRUE(balances.ok());
  ASSERT_EQ(balances.value->size(), 1u);
  EXPECT_EQ(balances.value->front().balance, 0u);
  EXPECT_FALSE(economy.resolver().find_account("nobody").has_value());
}

TEST(economy_types, pay_take_and_convert_by_name) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_economy"};
  auto& economy = fixture.economy();
  economy.onboard_guild("guild");
  economy.create_currency("guild", "gold");
  economy.create_currency("guild", "gems");
  ASSERT_TRUE(economy.set_exchange_rate("guild", "gold", "gems", "2.5").ok());

  ASSERT_TRUE(economy.grant("guild", "alice", 20).ok());
  auto paid = economy.pay("guild", "alice", "bob", 8);
  ASSERT_TRUE(paid.ok());
  EXPECT_EQ(paid.value->from.balance, 12u);
  EXPECT_EQ(paid.value->to.balance, 8u);

  EXPECT_EQ(economy.take("guild", "bob", 9).code,
            error_code::insufficient_balance);
  ASSERT_TRUE(economy.take("guild", "bob", 3).ok());

  auto converted = economy.convert("guild", "alice", "gold", "gems", 3);
  ASSERT_TRUE(converted.ok());
  EXPECT_EQ(converted.value->debited, 3u);
  EXPECT_EQ(converted.value->credited, 7u);
  EXPECT_EQ(economy.convert("guild", "alice", "gems", "gold", 1).code,
            error_code::rate_not_found);

  auto alice = economy.balances("guild", "alice");
  ASSERT_TRUE(alice.ok());
  EXPECT_EQ(lines_of(*alice.value),
            (std::vector<std::pair<std::string, amount_t>>{{"gold", 9},
                                                           {"gems", 7}}));
}

TEST(economy_types, exchange_rate_text_is_validated) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_economy"};
  auto& economy = fixture.economy();
  economy.onboard_guild("guild");
  economy.create_currency("guild", "gold");
  economy.create_currency("guild", "gems");

  EXPECT_EQ(economy.set_exchange_rate("guild", "gold", "gems", "lots").code,
            error_code::invalid_rate);
  EXPECT_EQ(economy.set_exchange_rate("guild", "gold", "gems", "0").code,
            error_code::invalid_rate);
  EXPECT_EQ(economy.set_exchange_rate("guild", "gold", "gold", "2").code,
            error_code::invalid_rate);
  EXPECT_EQ(economy.set_exchange_rate("guild", "gold", "dust", "2").code,
            error_code::currency_not_found);

  auto rate = economy.set_exchange_rate("guild", "gold", "gems", "0.25");
  ASSERT_TRUE(rate.ok());
  EXPECT_EQ(rate.value->rate, "0.25");
}

TEST(economy_types, notes_move_value_between_users) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_economy"};
  auto& economy = fixture.economy();
  economy.onboard_guild("guild");
  economy.create_currency("guild", "gold");
  economy.grant("guild", "alice", 10);

  auto issued = economy.issue_note("guild", "alice", "bob", 4);
  ASSERT_TRUE(issued.ok());
  EXPECT_EQ(economy.redeem_note("carol", issued.value->token).code,
            error_code::recipient_mismatch);

  auto redeemed = economy.redeem_note("bob", issued.value->token);
  ASSERT_TRUE(redeemed.ok());
  EXPECT_EQ(redeemed.value->credited, 4u);
  EXPECT_EQ(economy.redeem_note("bob", issued.value->token).code,
            error_code::already_consumed);

  auto bob = economy.balances("guild", "bob");
  ASSERT_TRUE(bob.ok());
  EXPECT_EQ(bob.value->front().balance, 4u);
  auto alice = economy.balances("guild", "alice");
  ASSERT_TRUE(alice.ok());
  EXPECT_EQ(alice.value->front().balance, 6u);
}

TEST(economy_types, leaderboard_defaults_to_primary_currency) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_economy"};
  auto& economy = fixture.economy();
  economy.onboard_guild("guild");
  economy.create_currency("guild", "gold");
  economy.grant("guild", "alice", 3);
  economy.grant("guild", "bob", 9);
  economy.grant("guild", "carol", 6);

  auto board = economy.leaderboard("guild", std::nullopt, 2);
  ASSERT_TRUE(board.ok());
  EXPECT_EQ(board.value->currency.display_name, "gold");
  ASSERT_EQ(board.value->entries.size(), 2u);
  EXPECT_EQ(board.value->entries[0].account_id, fixture.account("bob"));
  EXPECT_EQ(board.value->entries[1].account_id, fixture.account("carol"));
  EXPECT_EQ(economy.leaderboard("guild", "dust").code,
            error_code::currency_not_found);
}

TEST(economy_types, flush_persists_operation_history) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_economy"};
  auto& economy = fixture.economy();
  economy.onboard_guild("guild");
  economy.create_currency("guild", "gold");
  economy.grant("guild", "alice", 10);
  economy.pay("guild", "alice", "bob", 2);
  economy.take("guild", "bob", 1);
  EXPECT_EQ(economy.audit_queue().size(), 3u);

  auto result = economy.flush_audit(2);
  EXPECT_EQ(result.written, 2u);
  EXPECT_EQ(result.backlog, 1u);
  EXPECT_TRUE(result.alerted);
  EXPECT_EQ(fixture.alerts().size(), 1u);

  economy.flush_audit(2);
  auto stored = guildbank::audit::stored_events(fixture.storage());
  ASSERT_EQ(stored.size(), 3u);
  EXPECT_EQ(stored[0].kind, guildbank::schema::audit_event_kind_t::mint);
  EXPECT_EQ(stored[1].kind, guildbank::schema::audit_event_kind_t::transfer);
  EXPECT_EQ(stored[2].kind, guildbank::schema::audit_event_kind_t::burn);
}
