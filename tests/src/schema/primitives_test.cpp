#include <gtest/gtest.h>
#include <guildbank/schema/audit_event_kind.hpp>
#include <guildbank/schema/error_code.hpp>
#include <guildbank/schema/group_kind.hpp>
#include <guildbank/schema/primitives.hpp>

TEST(primitives, hex_round_trips_and_accepts_prefix) {
  auto bytes = guildbank::schema::bytes_t{0x01, 0xAB, 0xFF};
  EXPECT_EQ(guildbank::schema::to_hex(bytes), "01abff");

  auto decoded = guildbank::schema::try_from_hex("0x01ABff");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, bytes);
}

TEST(primitives, try_from_hex_rejects_odd_length_and_bad_digits) {
  EXPECT_FALSE(guildbank::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(guildbank::schema::try_from_hex("zz").has_value());
}

TEST(primitives, try_make_hash32_requires_32_bytes) {
  auto hex = std::string(64, 'a');
  auto hash = guildbank::schema::try_make_hash32(hex);
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0xAA);
  EXPECT_EQ((*hash)[31], 0xAA);
  EXPECT_FALSE(guildbank::schema::try_make_hash32("aabb").has_value());
}

TEST(primitives, base64url_uses_url_alphabet_without_padding) {
  auto bytes = guildbank::schema::bytes_t{0xFB, 0xFF};
  EXPECT_EQ(guildbank::schema::to_base64url(bytes), "-_8");

  auto decoded = guildbank::schema::try_from_base64url("-_8");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, bytes);

  auto text = std::string{"{\"alg\":\"HS256\"}"};
  auto encoded =
      guildbank::schema::to_base64url(guildbank::schema::make_bytes_view(text));
  auto round_trip = guildbank::schema::try_from_base64url(encoded);
  ASSERT_TRUE(round_trip.has_value());
  EXPECT_EQ(guildbank::schema::make_string(*round_trip), text);
}

TEST(primitives, try_from_base64url_rejects_non_canonical_input) {
  EXPECT_FALSE(guildbank::schema::try_from_base64url("abc=").has_value());
  EXPECT_FALSE(guildbank::schema::try_from_base64url("a+b/").has_value());
  EXPECT_FALSE(guildbank::schema::try_from_base64url("abcde").has_value());
  // Unused trailing bits must be zero.
  EXPECT_FALSE(guildbank::schema::try_from_base64url("-_9").has_value());
}

TEST(primitives, try_make_rate_accepts_plain_decimals_only) {
  auto rate = guildbank::schema::try_make_rate("1.5");
  ASSERT_TRUE(rate.has_value());
  EXPECT_EQ(*rate, guildbank::schema::rate_t{"1.5"});

  EXPECT_FALSE(guildbank::schema::try_make_rate("").has_value());
  EXPECT_FALSE(guildbank::schema::try_make_rate(".").has_value());
  EXPECT_FALSE(guildbank::schema::try_make_rate("-1").has_value());
  EXPECT_FALSE(guildbank::schema::try_make_rate("1e5").has_value());
  EXPECT_FALSE(guildbank::schema::try_make_rate("1.2.3").has_value());
}

TEST(primitives, rate_to_string_is_plain_decimal) {
  EXPECT_EQ(guildbank::schema::to_string(guildbank::schema::rate_t{"1.5"}),
            "1.5");
  EXPECT_EQ(guildbank::schema::to_string(guildbank::schema::rate_t{"2"}), "2");
  EXPECT_EQ(
      guildbank::schema::to_string(guildbank::schema::rate_t{"0.00001"}),
      "0.00001");
}

TEST(primitives, error_names_are_stable) {
  EXPECT_EQ(guildbank::schema::error_name(
                guildbank::schema::error_code::already_consumed),
            "already_consumed");
  EXPECT_EQ(guildbank::schema::error_name(
                guildbank::schema::error_code::storage_unavailable),
            "storage_unavailable");
}

TEST(primitives, kinds_have_stable_names) {
  using guildbank::schema::audit_event_kind_t;
  using guildbank::schema::group_kind_t;
  for (const auto& [name, kind] : guildbank::schema::kAuditEventKindNames) {
    EXPECT_EQ(guildbank::schema::kind_name(kind), name);
  }
  for (const auto& [name, kind] : guildbank::schema::kGroupKindNames) {
    EXPECT_EQ(guildbank::schema::kind_name(kind), name);
  }
  EXPECT_EQ(guildbank::schema::kind_name(audit_event_kind_t::note_redeem),
            "note_redeem");
  EXPECT_EQ(guildbank::schema::kind_name(group_kind_t::local), "local");
  EXPECT_EQ(guildbank::schema::kind_name(static_cast<audit_event_kind_t>(42)),
            "unknown");
}
