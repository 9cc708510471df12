#include <guildbank/schema/key/builder.hpp>
#include <guildbank/schema/key/keys.hpp>

namespace guildbank::schema::key {

const std::string_view kSequencePrefix{"SYS|SEQ|"};
const std::string_view kGlobalGroupKey{"SYS|STATE|GLOBAL_GROUP"};
const std::string_view kGroupPrefix{"SYS|STATE|GROUP|"};
const std::string_view kGuildPrefix{"SYS|STATE|GUILD|"};
const std::string_view kGuildExternalPrefix{"SYS|STATE|GUILD_EXT|"};
const std::string_view kMembershipPrefix{"SYS|STATE|MEMBERSHIP|"};
const std::string_view kAccountPrefix{"SYS|STATE|ACCOUNT|"};
const std::string_view kAccountExternalPrefix{"SYS|STATE|ACCOUNT_EXT|"};
const std::string_view kCurrencyPrefix{"SYS|STATE|CURRENCY|"};
const std::string_view kCurrencyNamePrefix{"SYS|STATE|CURRENCY_NAME|"};
const std::string_view kGroupCurrencyPrefix{"SYS|STATE|GROUP_CURRENCY|"};
const std::string_view kRatePrefix{"SYS|STATE|RATE|"};
const std::string_view kWalletPrefix{"SYS|STATE|WALLET|"};
const std::string_view kNotePrefix{"SYS|STATE|NOTE|"};
const std::string_view kAuditPrefix{"SYS|AUDIT|"};

bytes_t make_sequence_key(const std::string_view name) {
  return builder{}.write(kSequencePrefix).write(name).data;
}

bytes_t make_global_group_key() {
  return make_bytes(kGlobalGroupKey);
}

bytes_t make_group_key(const group_id_t group_id) {
  return builder{}.write(kGroupPrefix).write(group_id).data;
}

bytes_t make_guild_key(const guild_id_t guild_id) {
  return builder{}.write(kGuildPrefix).write(guild_id).data;
}

bytes_t make_guild_external_key(const std::string_view external_id) {
  return builder{}.write(kGuildExternalPrefix).hash(external_id).data;
}

bytes_t make_membership_key(const guild_id_t guild_id,
                            const group_id_t group_id) {
  return builder{}
      .write(kMembershipPrefix)
      .write(guild_id)
      .write(group_id)
      .data;
}

bytes_t make_membership_prefix(const guild_id_t guild_id) {
  return builder{}.write(kMembershipPrefix).write(guild_id).data;
}

bytes_t make_account_key(const account_id_t account_id) {
  return builder{}.write(kAccountPrefix).write(account_id).data;
}

bytes_t make_account_external_key(const std::string_view external_id) {
  return builder{}.write(kAccountExternalPrefix).hash(external_id).data;
}

bytes_t make_currency_key(const currency_id_t currency_id) {
  return builder{}.write(kCurrencyPrefix).write(currency_id).data;
}

bytes_t make_currency_name_key(const group_id_t group_id,
                               const std::string_view display_name) {
  return builder{}
      .write(kCurrencyNamePrefix)
      .write(group_id)
      .hash(display_name)
      .data;
}

bytes_t make_group_currency_key(const group_id_t group_id,
                                const currency_id_t currency_id) {
  return builder{}
      .write(kGroupCurrencyPrefix)
      .write(group_id)
      .write(currency_id)
      .data;
}

bytes_t make_group_currency_prefix(const group_id_t group_id) {
  return builder{}.write(kGroupCurrencyPrefix).write(group_id).data;
}

bytes_t make_rate_key(const group_id_t group_id,
                      const currency_id_t base_currency_id,
                      const currency_id_t quote_currency_id) {
  return builder{}
      .write(kRatePrefix)
      .write(group_id)
      .write(base_currency_id)
      .write(quote_currency_id)
      .data;
}

bytes_t make_rate_prefix(const group_id_t group_id) {
  return builder{}.write(kRatePrefix).write(group_id).data;
}

bytes_t make_wallet_key(const account_id_t account_id,
                        const currency_id_t currency_id) {
  return builder{}
      .write(kWalletPrefix)
      .write(account_id)
      .write(currency_id)
      .data;
}

bytes_t make_wallet_prefix() {
  return make_bytes(kWalletPrefix);
}

bytes_t make_wallet_prefix(const account_id_t account_id) {
  return builder{}.write(kWalletPrefix).write(account_id).data;
}

bytes_t make_note_key(const note_id_t& note_id) {
  return builder{}.write(kNotePrefix).write(note_id).data;
}

bytes_t make_note_prefix() {
  return make_bytes(kNotePrefix);
}

bytes_t make_audit_key(const hash32_t& natural_key) {
  return builder{}.write(kAuditPrefix).write(natural_key).data;
}

bytes_t make_audit_prefix() {
  return make_bytes(kAuditPrefix);
}

}  // namespace guildbank::schema::key
