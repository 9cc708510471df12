#include <guildbank/common/critical.hpp>
#include <guildbank/crypto/hmac.hpp>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#include <array>
#include <memory>

namespace guildbank::crypto {

namespace {

using evp_mac_ptr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using evp_mac_ctx_ptr =
    std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

}  // namespace

guildbank::schema::hash32_t hmac_sha256(
    const guildbank::schema::bytes_view_t& key,
    const guildbank::schema::bytes_view_t& message) {
  auto mac = evp_mac_ptr{EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr),
                         EVP_MAC_free};
  if (!mac) {
    guildbank::common::critical("OpenSSL HMAC implementation unavailable");
  }
  auto ctx = evp_mac_ctx_ptr{EVP_MAC_CTX_new(mac.get()), EVP_MAC_CTX_free};
  if (!ctx) {
    guildbank::common::critical("failed to allocate HMAC context");
  }

  char digest_name[] = "SHA256";
  auto params = std::array<OSSL_PARAM, 2>{
      OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest_name, 0),
      OSSL_PARAM_construct_end()};

  auto out = guildbank::schema::hash32_t{};
  auto out_size = std::size_t{};
  if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params.data()) != 1 ||
      EVP_MAC_update(ctx.get(), message.data(), message.size()) != 1 ||
      EVP_MAC_final(ctx.get(), out.data(), &out_size, out.size()) != 1 ||
      out_size != out.size()) {
    guildbank::common::critical("HMAC-SHA256 computation failed");
  }
  return out;
}

bool equal(const guildbank::schema::bytes_view_t& lhs,
           const guildbank::schema::bytes_view_t& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

guildbank::schema::bytes_t random_bytes(const std::size_t size) {
  auto out = guildbank::schema::bytes_t(size);
  if (size > 0 && RAND_bytes(out.data(), static_cast<int>(size)) != 1) {
    guildbank::common::critical("OpenSSL RAND_bytes failed");
  }
  return out;
}

}  // namespace guildbank::crypto
