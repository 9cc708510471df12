#include <json/json.h>
#include <guildbank/common/critical.hpp>
#include <guildbank/crypto/hmac.hpp>
#include <guildbank/notes/token.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace guildbank::schema;

namespace {

constexpr auto kAlgorithm = std::string_view{"HS256"};
constexpr auto kType = std::string_view{"JWT"};

std::string write_compact(const Json::Value& value) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

std::optional<Json::Value> parse_segment(const std::string_view segment) {
  auto decoded = try_from_base64url(segment);
  if (!decoded) {
    return std::nullopt;
  }
  auto text = make_string(make_bytes_view(*decoded));

  auto builder = Json::CharReaderBuilder{};
  builder["strictRoot"] = true;
  builder["rejectDupKeys"] = true;
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  auto value = Json::Value{};
  auto errors = std::string{};
  if (!reader->parse(text.data(), text.data() + text.size(), &value,
                     &errors) ||
      !value.isObject()) {
    return std::nullopt;
  }
  return value;
}

bool is_unsigned(const Json::Value& value) {
  return (value.type() == Json::uintValue || value.type() == Json::intValue) &&
         value.isUInt64();
}

std::vector<std::string_view> split(std::string_view token) {
  auto segments = std::vector<std::string_view>{};
  while (true) {
    auto dot = token.find('.');
    segments.push_back(token.substr(0, dot));
    if (dot == std::string_view::npos) {
      break;
    }
    token.remove_prefix(dot + 1);
  }
  return segments;
}

}  // namespace

namespace guildbank::notes {

token_codec::token_codec(bytes_t secret) : secret_{std::move(secret)} {
  if (secret_.empty()) {
    guildbank::common::critical("bank note secret must not be empty");
  }
}

std::string token_codec::sign(const note_claims& claims) const {
  auto header = Json::Value{Json::objectValue};
  header["alg"] = std::string{kAlgorithm};
  header["typ"] = std::string{kType};

  auto payload = Json::Value{Json::objectValue};
  payload["currencyId"] = Json::UInt64{claims.currency_id};
  payload["amount"] = Json::UInt64{claims.amount};
  payload["jti"] = to_hex(claims.note_id);
  payload["recipientId"] = claims.recipient_id;

  auto signing_input = to_base64url(make_bytes_view(write_compact(header))) +
                       "." +
                       to_base64url(make_bytes_view(write_compact(payload)));
  auto mac = signature(signing_input);
  return signing_input + "." + to_base64url(mac);
}

operation_result<note_claims> token_codec::verify(
    const std::string_view token) const {
  auto segments = split(token);
  if (segments.size() != 3) {
    return make_failure<note_claims>(error_code::invalid_signature,
                                     "token must have three segments");
  }

  auto provided = try_from_base64url(segments[2]);
  auto signing_input = token.substr(0, segments[0].size() + 1 +
                                           segments[1].size());
  auto expected = signature(signing_input);
  if (!provided ||
      !guildbank::crypto::equal(make_bytes_view(*provided), expected)) {
    return make_failure<note_claims>(error_code::invalid_signature,
                                     "signature does not verify");
  }

  auto header = parse_segment(segments[0]);
  if (!header || !(*header)["alg"].isString() ||
      (*header)["alg"].asString() != kAlgorithm) {
    return make_failure<note_claims>(error_code::invalid_signature,
                                     "unsupported token header");
  }

  auto payload = parse_segment(segments[1]);
  if (!payload) {
    return make_failure<note_claims>(error_code::invalid_signature,
                                     "token payload is not a JSON object");
  }
  const auto& currency_id = (*payload)["currencyId"];
  const auto& amount = (*payload)["amount"];
  const auto& jti = (*payload)["jti"];
  const auto& recipient_id = (*payload)["recipientId"];
  if (!is_unsigned(currency_id) || !is_unsigned(amount) || !jti.isString() ||
      !recipient_id.isString()) {
    return make_failure<note_claims>(error_code::invalid_signature,
                                     "token payload is missing claims");
  }
  auto note_id = try_make_hash32(jti.asString());
  if (!note_id) {
    return make_failure<note_claims>(error_code::invalid_signature,
                                     "token id is not a note id");
  }

  return make_success(note_claims{.currency_id = currency_id.asUInt64(),
                                  .amount = amount.asUInt64(),
                                  .note_id = *note_id,
                                  .recipient_id = recipient_id.asString()});
}

hash32_t token_codec::signature(const std::string_view signing_input) const {
  return guildbank::crypto::hmac_sha256(make_bytes_view(secret_),
                                        make_bytes_view(signing_input));
}

}  // namespace guildbank::notes
