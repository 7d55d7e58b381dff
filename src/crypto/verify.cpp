#include <warden/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <vector>

namespace warden::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

bool is_recovery_id(const uint8_t value) {
  return value <= 3 || value >= 27;
}

evp_pkey_ptr make_public_key(
    const warden::schema::registrar_key_t& registrar_key) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(registrar_key.data()),
                     registrar_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

std::optional<std::vector<uint8_t>> make_der_signature(
    const std::array<uint8_t, 64>& compact) {
  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return std::nullopt;
  }

  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return std::nullopt;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr) != der_len) {
    return std::nullopt;
  }
  return der;
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ctx = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ctx != nullptr;
  }();
  return available_now;
}

std::vector<std::array<uint8_t, 64>> canonical_signatures(
    const warden::schema::registrar_signature_t& signature) {
  // Accepted layouts are [v || r || s] and [r || s || v], with recovery ids
  // 0..3 or legacy 27+.
  auto out = std::vector<std::array<uint8_t, 64>>{};
  if (is_recovery_id(signature[0])) {
    auto& compact = out.emplace_back();
    std::copy_n(signature.data() + 1, compact.size(), compact.data());
  }
  if (is_recovery_id(signature[64])) {
    auto& compact = out.emplace_back();
    std::copy_n(signature.data(), compact.size(), compact.data());
  }
  return out;
}

bool verify_registrar_signature(
    const warden::schema::bytes_view_t& message,
    const warden::schema::registrar_key_t& registrar_key,
    const warden::schema::registrar_signature_t& signature) {
  auto candidates = canonical_signatures(signature);
  if (candidates.empty()) {
    return false;
  }

  auto pkey = make_public_key(registrar_key);
  if (!pkey) {
    return false;
  }

  for (const auto& candidate : candidates) {
    auto der = make_der_signature(candidate);
    if (!der.has_value()) {
      continue;
    }
    auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (!ctx) {
      return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                             pkey.get()) != 1) {
      return false;
    }
    if (EVP_DigestVerify(ctx.get(), der->data(), der->size(), message.data(),
                         message.size()) == 1) {
      return true;
    }
  }
  return false;
}

}  // namespace warden::crypto
