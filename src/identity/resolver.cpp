#include <spdlog/spdlog.h>
#include <guildbank/identity/resolver.hpp>
#include <guildbank/schema/encoding/scale/encoder.hpp>
#include <guildbank/schema/key/keys.hpp>
#include <guildbank/storage/sequence.hpp>
#include <array>
#include <string>

using namespace guildbank::schema;

namespace {

using encoder_t = guildbank::schema::encoding::scale_encoder_t;
using guildbank::storage::storage_unavailable;

}  // namespace

namespace guildbank::identity {

resolver::resolver(guildbank::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

operation_result<group_state_t> resolver::ensure_global_group() {
  auto encoder = encoder_t{};
  try {
    auto work = storage_.begin();
    auto pointer_key = key::make_global_group_key();
    auto existing =
        work.get_for_update<group_id_t>(encoder, make_bytes_view(pointer_key));
    if (existing) {
      auto group = storage_.get<group_state_t>(
          encoder, make_bytes_view(key::make_group_key(*existing)));
      if (!group) {
        guildbank::common::critical("global group pointer is dangling");
      }
      return make_success(*group);
    }

    auto group = group_state_t{
        .group_id = guildbank::storage::next_sequence(
            work, encoder, guildbank::storage::kGroupSequence),
        .kind = group_kind_t::global,
        .owner_guild_id = std::nullopt,
        .primary_currency_id = std::nullopt,
        .created_at = now_milliseconds()};
    work.put(encoder, make_bytes_view(pointer_key), group.group_id);
    work.put(encoder, make_bytes_view(key::make_group_key(group.group_id)),
             group);
    work.commit();
    spdlog::info("Created {} group {}", kind_name(group.kind), group.group_id);
    return make_success(group);
  } catch (const storage_unavailable& ex) {
    return make_failure<group_state_t>(error_code::storage_unavailable,
                                       ex.what());
  }
}

operation_result<guild_state_t> resolver::onboard_guild(
    const std::string_view external_guild_id) {
  auto global = ensure_global_group();
  if (!global.ok()) {
    return make_failure<guild_state_t>(global.code, global.log);
  }

  auto encoder = encoder_t{};
  try {
    auto work = storage_.begin();
    auto external_key = key::make_guild_external_key(external_guild_id);
    auto existing =
        work.get_for_update<guild_id_t>(encoder, make_bytes_view(external_key));
    if (existing) {
      auto guild = storage_.get<guild_state_t>(
          encoder, make_bytes_view(key::make_guild_key(*existing)));
      if (!guild) {
        guildbank::common::critical("guild index references a missing guild");
      }
      return make_success(*guild);
    }

    const auto now = now_milliseconds();
    const auto guild_id = guildbank::storage::next_sequence(
        work, encoder, guildbank::storage::kGuildSequence);
    auto group = group_state_t{
        .group_id = guildbank::storage::next_sequence(
            work, encoder, guildbank::storage::kGroupSequence),
        .kind = group_kind_t::single,
        .owner_guild_id = guild_id,
        .primary_currency_id = std::nullopt,
        .created_at = now};
    auto guild = guild_state_t{.guild_id = guild_id,
                               .external_id = std::string{external_guild_id},
                               .single_group_id = group.group_id,
                               .created_at = now};

    work.put(encoder, make_bytes_view(external_key), guild_id);
    work.put(encoder, make_bytes_view(key::make_guild_key(guild_id)), guild);
    work.put(encoder, make_bytes_view(key::make_group_key(group.group_id)),
             group);
    for (const auto group_id :
         std::array<group_id_t, 2>{group.group_id, global.value->group_id}) {
      work.put(encoder,
               make_bytes_view(key::make_membership_key(guild_id, group_id)),
               guild_membership_t{
                   .guild_id = guild_id, .group_id = group_id, .joined_at = now});
    }
    work.commit();
    spdlog::info("Onboarded guild '{}' as {} with {} group {}",
                 external_guild_id, guild_id, kind_name(group.kind),
                 group.group_id);
    return make_success(guild);
  } catch (const storage_unavailable& ex) {
    return make_failure<guild_state_t>(error_code::storage_unavailable,
                                       ex.what());
  }
}

operation_result<group_state_t> resolver::create_local_group(
    const guild_id_t owner_guild_id) {
  auto encoder = encoder_t{};
  try {
    auto work = storage_.begin();
    auto owner = work.get_for_update<guild_state_t>(
        encoder, make_bytes_view(key::make_guild_key(owner_guild_id)));
    if (!owner) {
      return make_failure<group_state_t>(error_code::guild_not_found,
                                         "owner guild does not exist");
    }

    const auto now = now_milliseconds();
    auto group = group_state_t{
        .group_id = guildbank::storage::next_sequence(
            work, encoder, guildbank::storage::kGroupSequence),
        .kind = group_kind_t::local,
        .owner_guild_id = owner_guild_id,
        .primary_currency_id = std::nullopt,
        .created_at = now};
    work.put(encoder, make_bytes_view(key::make_group_key(group.group_id)),
             group);
    work.put(encoder,
             make_bytes_view(
                 key::make_membership_key(owner_guild_id, group.group_id)),
             guild_membership_t{.guild_id = owner_guild_id,
                                .group_id = group.group_id,
                                .joined_at = now});
    work.commit();
    spdlog::info("Guild {} created {} group {}", owner_guild_id,
                 kind_name(group.kind), group.group_id);
    return make_success(group);
  } catch (const storage_unavailable& ex) {
    return make_failure<group_state_t>(error_code::storage_unavailable,
                                       ex.what());
  }
}

operation_result<guild_membership_t> resolver::join_group(
    const guild_id_t guild_id,
    const group_id_t group_id) {
  auto encoder = encoder_t{};
  try {
    auto guild = storage_.get<guild_state_t>(
        encoder, make_bytes_view(key::make_guild_key(guild_id)));
    if (!guild) {
      return make_failure<guild_membership_t>(error_code::guild_not_found,
                                              "guild does not exist");
    }
    auto group = storage_.get<group_state_t>(
        encoder, make_bytes_view(key::make_group_key(group_id)));
    if (!group) {
      return make_failure<guild_membership_t>(error_code::group_not_found,
                                              "group does not exist");
    }
    if (group->kind != group_kind_t::local) {
      return make_failure<guild_membership_t>(
          error_code::invalid_group,
          "cannot join a " + std::string{kind_name(group->kind)} + " group");
    }

    auto work = storage_.begin();
    auto membership_key = key::make_membership_key(guild_id, group_id);
    auto existing = work.get_for_update<guild_membership_t>(
        encoder, make_bytes_view(membership_key));
    if (existing) {
      return make_success(*existing);
    }
    auto membership = guild_membership_t{.guild_id = guild_id,
                                         .group_id = group_id,
                                         .joined_at = now_milliseconds()};
    work.put(encoder, make_bytes_view(membership_key), membership);
    work.commit();
    spdlog::info("Guild {} joined local group {}", guild_id, group_id);
    return make_success(membership);
  } catch (const storage_unavailable& ex) {
    return make_failure<guild_membership_t>(error_code::storage_unavailable,
                                            ex.what());
  }
}

operation_result<account_state_t> resolver::resolve_account(
    const std::string_view external_user_id) {
  auto encoder = encoder_t{};
  try {
    if (auto account = find_account(external_user_id)) {
      return make_success(*account);
    }

    auto work = storage_.begin();
    auto external_key = key::make_account_external_key(external_user_id);
    auto existing = work.get_for_update<account_id_t>(
        encoder, make_bytes_view(external_key));
    if (existing) {
      // Created concurrently between the lookup and the lock.
      auto account = storage_.get<account_state_t>(
          encoder, make_bytes_view(key::make_account_key(*existing)));
      if (!account) {
        guildbank::common::critical(
            "account index references a missing account");
      }
      return make_success(*account);
    }

    auto account = account_state_t{
        .account_id = guildbank::storage::next_sequence(
            work, encoder, guildbank::storage::kAccountSequence),
        .external_id = std::string{external_user_id},
        .created_at = now_milliseconds()};
    work.put(encoder, make_bytes_view(external_key), account.account_id);
    work.put(encoder,
             make_bytes_view(key::make_account_key(account.account_id)),
             account);
    work.commit();
    spdlog::debug("Created account {} for '{}'", account.account_id,
                  external_user_id);
    return make_success(account);
  } catch (const storage_unavailable& ex) {
    return make_failure<account_state_t>(error_code::storage_unavailable,
                                         ex.what());
  }
}

std::optional<account_state_t> resolver::find_account(
    const std::string_view external_user_id) const {
  auto encoder = encoder_t{};
  auto account_id = storage_.get<account_id_t>(
      encoder,
      make_bytes_view(key::make_account_external_key(external_user_id)));
  if (!account_id) {
    return std::nullopt;
  }
  return find_account(*account_id);
}

std::optional<account_state_t> resolver::find_account(
    const account_id_t account_id) const {
  auto encoder = encoder_t{};
  return storage_.get<account_state_t>(
      encoder, make_bytes_view(key::make_account_key(account_id)));
}

std::optional<guild_state_t> resolver::find_guild(
    const std::string_view external_guild_id) const {
  auto encoder = encoder_t{};
  auto guild_id = storage_.get<guild_id_t>(
      encoder,
      make_bytes_view(key::make_guild_external_key(external_guild_id)));
  if (!guild_id) {
    return std::nullopt;
  }
  return storage_.get<guild_state_t>(
      encoder, make_bytes_view(key::make_guild_key(*guild_id)));
}

std::optional<group_state_t> resolver::find_group(
    const group_id_t group_id) const {
  auto encoder = encoder_t{};
  return storage_.get<group_state_t>(
      encoder, make_bytes_view(key::make_group_key(group_id)));
}

std::vector<guild_membership_t> resolver::memberships(
    const guild_id_t guild_id) const {
  auto encoder = encoder_t{};
  auto prefix = key::make_membership_prefix(guild_id);
  auto memberships = std::vector<guild_membership_t>{};
  for (const auto& [entry_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    memberships.push_back(encoder.decode<guild_membership_t>(
        bytes_view_t{value.data(), value.size()}));
  }
  return memberships;
}

}  // namespace guildbank::identity
