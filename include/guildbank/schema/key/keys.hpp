#pragma once
#include <guildbank/schema/primitives.hpp>
#include <string_view>

// Keyspace layout of the ledger store. Every row key is a textual keyspace
// prefix followed by big-endian ids (or a BLAKE3 digest for external ids).
namespace guildbank::schema::key {

extern const std::string_view kSequencePrefix;
extern const std::string_view kGlobalGroupKey;
extern const std::string_view kGroupPrefix;
extern const std::string_view kGuildPrefix;
extern const std::string_view kGuildExternalPrefix;
extern const std::string_view kMembershipPrefix;
extern const std::string_view kAccountPrefix;
extern const std::string_view kAccountExternalPrefix;
extern const std::string_view kCurrencyPrefix;
extern const std::string_view kCurrencyNamePrefix;
extern const std::string_view kGroupCurrencyPrefix;
extern const std::string_view kRatePrefix;
extern const std::string_view kWalletPrefix;
extern const std::string_view kNotePrefix;
extern const std::string_view kAuditPrefix;

bytes_t make_sequence_key(std::string_view name);
bytes_t make_global_group_key();
bytes_t make_group_key(group_id_t group_id);
bytes_t make_guild_key(guild_id_t guild_id);
bytes_t make_guild_external_key(std::string_view external_id);
bytes_t make_membership_key(guild_id_t guild_id, group_id_t group_id);
bytes_t make_membership_prefix(guild_id_t guild_id);
bytes_t make_account_key(account_id_t account_id);
bytes_t make_account_external_key(std::string_view external_id);
bytes_t make_currency_key(currency_id_t currency_id);
bytes_t make_currency_name_key(group_id_t group_id,
                               std::string_view display_name);
bytes_t make_group_currency_key(group_id_t group_id, currency_id_t currency_id);
bytes_t make_group_currency_prefix(group_id_t group_id);
bytes_t make_rate_key(group_id_t group_id,
                      currency_id_t base_currency_id,
                      currency_id_t quote_currency_id);
bytes_t make_rate_prefix(group_id_t group_id);
bytes_t make_wallet_key(account_id_t account_id, currency_id_t currency_id);
bytes_t make_wallet_prefix();
bytes_t make_wallet_prefix(account_id_t account_id);
bytes_t make_note_key(const note_id_t& note_id);
bytes_t make_note_prefix();
bytes_t make_audit_key(const hash32_t& natural_key);
bytes_t make_audit_prefix();

}  // namespace guildbank::schema::key
