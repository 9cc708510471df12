#include <boost/multiprecision/cpp_dec_float.hpp>
#include <guildbank/common/critical.hpp>
#include <guildbank/exchange/engine.hpp>
#include <guildbank/schema/encoding/scale/encoder.hpp>
#include <guildbank/schema/exchange_rate.hpp>
#include <guildbank/schema/key/keys.hpp>
#include <limits>

using namespace guildbank::schema;

namespace {

using encoder_t = guildbank::schema::encoding::scale_encoder_t;

rate_t parse_or_die(const exchange_rate_t& record) {
  auto rate = try_make_rate(record.rate);
  if (!rate || *rate <= 0) {
    guildbank::common::critical("stored exchange rate is not a positive decimal");
  }
  return *rate;
}

}  // namespace

namespace guildbank::exchange {

engine::engine(const guildbank::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

std::optional<rate_t> engine::rate_for(
    const group_id_t group_id,
    const currency_id_t base_currency_id,
    const currency_id_t quote_currency_id) const {
  auto encoder = encoder_t{};
  auto record = storage_.get<exchange_rate_t>(
      encoder, make_bytes_view(key::make_rate_key(group_id, base_currency_id,
                                                  quote_currency_id)));
  if (!record) {
    return std::nullopt;
  }
  return parse_or_die(*record);
}

std::map<currency_id_t, rate_t> engine::rates_into(
    const group_id_t group_id,
    const currency_id_t quote_currency_id) const {
  auto encoder = encoder_t{};
  auto rates = std::map<currency_id_t, rate_t>{};
  for (const auto& [entry_key, value] :
       storage_.list_by_prefix(make_bytes_view(key::make_rate_prefix(group_id)))) {
    auto record =
        encoder.decode<exchange_rate_t>(bytes_view_t{value.data(), value.size()});
    if (record.quote_currency_id == quote_currency_id) {
      rates.emplace(record.base_currency_id, parse_or_die(record));
    }
  }
  return rates;
}

std::optional<amount_t> engine::convert(const amount_t amount,
                                        const rate_t& rate) {
  const rate_t product = boost::multiprecision::floor(rate_t{amount} * rate);
  if (product < 0 || product > rate_t{std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return product.convert_to<amount_t>();
}

}  // namespace guildbank::exchange
