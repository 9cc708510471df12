#pragma once

#include <guildbank/schema/operation_result.hpp>
#include <guildbank/schema/primitives.hpp>
#include <string>
#include <string_view>

namespace guildbank::notes {

struct note_claims final {
  guildbank::schema::currency_id_t currency_id{};
  guildbank::schema::amount_t amount{};
  guildbank::schema::note_id_t note_id{};
  std::string recipient_id;
};

/// Compact HS256 token: base64url(header) "." base64url(payload) "."
/// base64url(HMAC-SHA256 of the first two segments under the secret).
class token_codec final {
 public:
  explicit token_codec(guildbank::schema::bytes_t secret);

  std::string sign(const note_claims& claims) const;

  /// Verify the signature and decode the claims. Any malformed or
  /// mismatching token yields error_code::invalid_signature.
  guildbank::schema::operation_result<note_claims> verify(
      std::string_view token) const;

 private:
  guildbank::schema::hash32_t signature(std::string_view signing_input) const;

  guildbank::schema::bytes_t secret_;
};

}  // namespace guildbank::notes
