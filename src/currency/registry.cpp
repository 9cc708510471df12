#include <spdlog/spdlog.h>
#include <guildbank/currency/registry.hpp>
#include <guildbank/schema/encoding/scale/encoder.hpp>
#include <guildbank/schema/key/keys.hpp>
#include <guildbank/storage/sequence.hpp>
#include <string>

using namespace guildbank::schema;

namespace {

using encoder_t = guildbank::schema::encoding::scale_encoder_t;
using guildbank::storage::storage_unavailable;

}  // namespace

namespace guildbank::currency {

registry::registry(guildbank::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

operation_result<currency_state_t> registry::create_currency(
    const group_id_t group_id,
    const std::string_view display_name) {
  auto encoder = encoder_t{};
  try {
    auto work = storage_.begin();
    auto group_key = key::make_group_key(group_id);
    auto group =
        work.get_for_update<group_state_t>(encoder, make_bytes_view(group_key));
    if (!group) {
      return make_failure<currency_state_t>(error_code::group_not_found,
                                            "group does not exist");
    }

    auto name_key = key::make_currency_name_key(group_id, display_name);
    auto existing =
        work.get_for_update<currency_id_t>(encoder, make_bytes_view(name_key));
    if (existing) {
      return make_failure<currency_state_t>(
          error_code::currency_exists,
          "currency '" + std::string{display_name} + "' already exists");
    }

    auto currency = currency_state_t{
        .currency_id = guildbank::storage::next_sequence(
            work, encoder, guildbank::storage::kCurrencySequence),
        .group_id = group_id,
        .display_name = std::string{display_name},
        .primary = !group->primary_currency_id.has_value(),
        .created_at = now_milliseconds()};

    work.put(encoder,
             make_bytes_view(key::make_currency_key(currency.currency_id)),
             currency);
    work.put(encoder, make_bytes_view(name_key), currency.currency_id);
    work.put(encoder,
             make_bytes_view(
                 key::make_group_currency_key(group_id, currency.currency_id)),
             currency.currency_id);
    if (currency.primary) {
      group->primary_currency_id = currency.currency_id;
      work.put(encoder, make_bytes_view(group_key), *group);
    }
    work.commit();
    spdlog::info("Created currency {} '{}' in group {}{}", currency.currency_id,
                 display_name, group_id, currency.primary ? " (primary)" : "");
    return make_success(currency);
  } catch (const storage_unavailable& ex) {
    return make_failure<currency_state_t>(error_code::storage_unavailable,
                                          ex.what());
  }
}

operation_result<currency_state_t> registry::set_primary_currency(
    const group_id_t group_id,
    const currency_id_t currency_id) {
  auto encoder = encoder_t{};
  try {
    auto work = storage_.begin();
    auto group_key = key::make_group_key(group_id);
    auto group =
        work.get_for_update<group_state_t>(encoder, make_bytes_view(group_key));
    if (!group) {
      return make_failure<currency_state_t>(error_code::group_not_found,
                                            "group does not exist");
    }

    auto currency_key = key::make_currency_key(currency_id);
    auto currency = work.get_for_update<currency_state_t>(
        encoder, make_bytes_view(currency_key));
    if (!currency || currency->group_id != group_id) {
      return make_failure<currency_state_t>(error_code::currency_not_found,
                                            "currency is not part of group");
    }
    if (currency->primary) {
      return make_success(*currency);
    }

    if (group->primary_currency_id) {
      auto previous_key = key::make_currency_key(*group->primary_currency_id);
      auto previous = work.get_for_update<currency_state_t>(
          encoder, make_bytes_view(previous_key));
      if (previous) {
        previous->primary = false;
        work.put(encoder, make_bytes_view(previous_key), *previous);
      }
    }
    currency->primary = true;
    group->primary_currency_id = currency_id;
    work.put(encoder, make_bytes_view(currency_key), *currency);
    work.put(encoder, make_bytes_view(group_key), *group);
    work.commit();
    spdlog::info("Currency {} is now primary in group {}", currency_id,
                 group_id);
    return make_success(*currency);
  } catch (const storage_unavailable& ex) {
    return make_failure<currency_state_t>(error_code::storage_unavailable,
                                          ex.what());
  }
}

operation_result<exchange_rate_t> registry::set_exchange_rate(
    const group_id_t group_id,
    const currency_id_t base_currency_id,
    const currency_id_t quote_currency_id,
    const rate_t& rate) {
  if (rate <= 0) {
    return make_failure<exchange_rate_t>(error_code::invalid_rate,
                                         "rate must be positive");
  }
  if (base_currency_id == quote_currency_id) {
    return make_failure<exchange_rate_t>(
        error_code::invalid_rate, "base and quote currency must differ");
  }

  auto encoder = encoder_t{};
  try {
    auto work = storage_.begin();
    auto group = work.get_for_update<group_state_t>(
        encoder, make_bytes_view(key::make_group_key(group_id)));
    if (!group) {
      return make_failure<exchange_rate_t>(error_code::group_not_found,
                                           "group does not exist");
    }
    for (const auto currency_id : {base_currency_id, quote_currency_id}) {
      auto currency = find_currency(currency_id);
      if (!currency || currency->group_id != group_id) {
        return make_failure<exchange_rate_t>(
            error_code::currency_not_found,
            "currency " + std::to_string(currency_id) + " is not part of group");
      }
    }

    auto record = exchange_rate_t{.group_id = group_id,
                                  .base_currency_id = base_currency_id,
                                  .quote_currency_id = quote_currency_id,
                                  .rate = to_string(rate),
                                  .updated_at = now_milliseconds()};
    work.put(encoder,
             make_bytes_view(key::make_rate_key(group_id, base_currency_id,
                                                quote_currency_id)),
             record);
    work.commit();
    spdlog::info("Set rate {} -> {} = {} in group {}", base_currency_id,
                 quote_currency_id, record.rate, group_id);
    return make_success(record);
  } catch (const storage_unavailable& ex) {
    return make_failure<exchange_rate_t>(error_code::storage_unavailable,
                                         ex.what());
  }
}

std::optional<currency_state_t> registry::find_currency(
    const currency_id_t currency_id) const {
  auto encoder = encoder_t{};
  return storage_.get<currency_state_t>(
      encoder, make_bytes_view(key::make_currency_key(currency_id)));
}

std::optional<currency_state_t> registry::find_currency(
    const group_id_t group_id,
    const std::string_view display_name) const {
  auto encoder = encoder_t{};
  auto currency_id = storage_.get<currency_id_t>(
      encoder,
      make_bytes_view(key::make_currency_name_key(group_id, display_name)));
  if (!currency_id) {
    return std::nullopt;
  }
  return find_currency(*currency_id);
}

std::optional<currency_state_t> registry::primary_currency(
    const group_id_t group_id) const {
  auto encoder = encoder_t{};
  auto group = storage_.get<group_state_t>(
      encoder, make_bytes_view(key::make_group_key(group_id)));
  if (!group || !group->primary_currency_id) {
    return std::nullopt;
  }
  return find_currency(*group->primary_currency_id);
}

std::vector<currency_state_t> registry::currencies(
    const group_id_t group_id) const {
  auto encoder = encoder_t{};
  auto result = std::vector<currency_state_t>{};
  for (const auto& [entry_key, value] : storage_.list_by_prefix(
           make_bytes_view(key::make_group_currency_prefix(group_id)))) {
    auto currency_id =
        encoder.decode<currency_id_t>(bytes_view_t{value.data(), value.size()});
    if (auto currency = find_currency(currency_id)) {
      result.push_back(std::move(*currency));
    }
  }
  return result;
}

std::vector<exchange_rate_t> registry::exchange_rates(
    const group_id_t group_id) const {
  auto encoder = encoder_t{};
  auto result = std::vector<exchange_rate_t>{};
  for (const auto& [entry_key, value] :
       storage_.list_by_prefix(make_bytes_view(key::make_rate_prefix(group_id)))) {
    result.push_back(
        encoder.decode<exchange_rate_t>(bytes_view_t{value.data(), value.size()}));
  }
  return result;
}

}  // namespace guildbank::currency
