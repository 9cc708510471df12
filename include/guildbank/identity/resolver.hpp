#pragma once

#include <guildbank/schema/account_state.hpp>
#include <guildbank/schema/group_state.hpp>
#include <guildbank/schema/guild_membership.hpp>
#include <guildbank/schema/guild_state.hpp>
#include <guildbank/schema/operation_result.hpp>
#include <guildbank/storage/rocksdb/storage.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace guildbank::identity {

/// Every guild owns one single group and belongs to the global group.
class resolver final {
 public:
  explicit resolver(guildbank::storage::rocksdb_storage_t& storage);

  guildbank::schema::operation_result<guildbank::schema::group_state_t>
  ensure_global_group();

  /// Register a guild together with its single group. Idempotent.
  guildbank::schema::operation_result<guildbank::schema::guild_state_t>
  onboard_guild(std::string_view external_guild_id);

  /// Create a local group owned by the guild and join the owner to it.
  guildbank::schema::operation_result<guildbank::schema::group_state_t>
  create_local_group(guildbank::schema::guild_id_t owner_guild_id);

  /// Join a guild to a local group. Idempotent.
  guildbank::schema::operation_result<guildbank::schema::guild_membership_t>
  join_group(guildbank::schema::guild_id_t guild_id,
             guildbank::schema::group_id_t group_id);

  /// Return the account bound to the external user, creating it if needed.
  guildbank::schema::operation_result<guildbank::schema::account_state_t>
  resolve_account(std::string_view external_user_id);

  std::optional<guildbank::schema::account_state_t> find_account(
      std::string_view external_user_id) const;
  std::optional<guildbank::schema::account_state_t> find_account(
      guildbank::schema::account_id_t account_id) const;
  std::optional<guildbank::schema::guild_state_t> find_guild(
      std::string_view external_guild_id) const;
  std::optional<guildbank::schema::group_state_t> find_group(
      guildbank::schema::group_id_t group_id) const;
  std::vector<guildbank::schema::guild_membership_t> memberships(
      guildbank::schema::guild_id_t guild_id) const;

 private:
  guildbank::storage::rocksdb_storage_t& storage_;
};

}  // namespace guildbank::identity
