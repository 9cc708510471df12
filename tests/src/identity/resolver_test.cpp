#include <gtest/gtest.h>
#include <guildbank/testing/economy_fixture.hpp>

#include <algorithm>

using guildbank::schema::error_code;
using guildbank::schema::group_kind_t;

TEST(identity_types, global_group_is_created_once) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_identity"};
  auto& resolver = fixture.economy().resolver();

  auto first = resolver.ensure_global_group();
  auto second = resolver.ensure_global_group();
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(first.value->group_id, second.value->group_id);
  EXPECT_EQ(first.value->kind, group_kind_t::global);
}

TEST(identity_types, onboarding_creates_single_group_and_is_idempotent) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_identity"};
  auto& resolver = fixture.economy().resolver();

  auto guild = resolver.onboard_guild("guild-1");
  ASSERT_TRUE(guild.ok());
  auto again = resolver.onboard_guild("guild-1");
  ASSERT_TRUE(again.ok());
  EXPECT_EQ(again.value->guild_id, guild.value->guild_id);
  EXPECT_EQ(again.value->single_group_id, guild.value->single_group_id);

  auto group = resolver.find_group(guild.value->single_group_id);
  ASSERT_TRUE(group.has_value());
  EXPECT_EQ(group->kind, group_kind_t::single);
  EXPECT_EQ(group->owner_guild_id, guild.value->guild_id);

  auto global = resolver.ensure_global_group();
  auto memberships = resolver.memberships(guild.value->guild_id);
  ASSERT_EQ(memberships.size(), 2u);
  auto in_global = std::ranges::any_of(memberships, [&](const auto& m) {
    return m.group_id == global.value->group_id;
  });
  auto in_single = std::ranges::any_of(memberships, [&](const auto& m) {
    return m.group_id == guild.value->single_group_id;
  });
  EXPECT_TRUE(in_global);
  EXPECT_TRUE(in_single);
}

TEST(identity_types, distinct_guilds_get_distinct_single_groups) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_identity"};
  auto first = fixture.onboard("guild-a");
  auto second = fixture.onboard("guild-b");
  EXPECT_NE(first, second);
}

TEST(identity_types, accounts_are_created_lazily_in_creation_order) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_identity"};
  auto& resolver = fixture.economy().resolver();

  EXPECT_FALSE(resolver.find_account("alice").has_value());
  auto alice = resolver.resolve_account("alice");
  auto bob = resolver.resolve_account("bob");
  ASSERT_TRUE(alice.ok());
  ASSERT_TRUE(bob.ok());
  EXPECT_LT(alice.value->account_id, bob.value->account_id);

  auto alice_again = resolver.resolve_account("alice");
  EXPECT_EQ(alice_again.value->account_id, alice.value->account_id);

  auto found = resolver.find_account(alice.value->account_id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->external_id, "alice");
}

TEST(identity_types, local_groups_can_be_joined_but_single_groups_cannot) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_identity"};
  auto& resolver = fixture.economy().resolver();
  auto owner = resolver.onboard_guild("owner");
  auto guest = resolver.onboard_guild("guest");

  auto local = resolver.create_local_group(owner.value->guild_id);
  ASSERT_TRUE(local.ok());
  EXPECT_EQ(local.value->kind, group_kind_t::local);

  auto joined =
      resolver.join_group(guest.value->guild_id, local.value->group_id);
  ASSERT_TRUE(joined.ok());
  EXPECT_EQ(resolver.memberships(guest.value->guild_id).size(), 3u);

  auto rejected = resolver.join_group(guest.value->guild_id,
                                      owner.value->single_group_id);
  EXPECT_EQ(rejected.code, error_code::invalid_group);
  EXPECT_EQ(rejected.log, "cannot join a single group");

  auto missing = resolver.create_local_group(9999);
  EXPECT_EQ(missing.code, error_code::guild_not_found);
}

TEST(identity_types, storage_fault_is_reported_as_unavailable) {
  auto fixture = guildbank::testing::economy_fixture{"guildbank_identity"};
  fixture.fail_storage();
  auto account = fixture.economy().resolver().resolve_account("alice");
  EXPECT_EQ(account.code, error_code::storage_unavailable);
  fixture.restore_storage();
  EXPECT_FALSE(
      fixture.economy().resolver().find_account("alice").has_value());
}
