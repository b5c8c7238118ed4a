#include <registrar/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

using namespace registrar::schema;

namespace registrar::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

bool digest_verify(EVP_PKEY* pkey,
                   const EVP_MD* digest,
                   const bytes_view_t& signature,
                   const bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, pkey) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

bool verify_ed25519(const bytes_view_t& message,
                    const ed25519_signer_id& signer,
                    const ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }
  return digest_verify(pkey.get(), nullptr,
                       bytes_view_t{signature.data(), signature.size()},
                       message);
}

// 65-byte secp256k1 signatures carry a recovery id either in front
// ([v || r || s]) or at the back ([r || s || v]). Recovery ids are 0..3 or the
// legacy 27+ form; anything else on both ends is rejected.
std::optional<std::array<uint8_t, 64>> compact_secp_signature(
    const secp256k1_signature_t& signature) {
  auto is_recovery_id = [](const uint8_t v) { return v <= 3 || v >= 27; };
  auto out = std::array<uint8_t, 64>{};
  if (is_recovery_id(signature.front())) {
    std::copy_n(signature.data() + 1, out.size(), out.data());
    return out;
  }
  if (is_recovery_id(signature.back())) {
    std::copy_n(signature.data(), out.size(), out.data());
    return out;
  }
  return std::nullopt;
}

evp_pkey_ptr make_secp256k1_key(const secp256k1_signer_id& signer) {
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
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

std::optional<std::vector<uint8_t>> der_encode(
    const std::array<uint8_t, 64>& compact) {
  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!ecdsa_sig || !r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return std::nullopt;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<std::size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr) != der_len) {
    return std::nullopt;
  }
  return der;
}

bool verify_secp256k1(const bytes_view_t& message,
                      const secp256k1_signer_id& signer,
                      const secp256k1_signature_t& signature) {
  auto compact = compact_secp_signature(signature);
  if (!compact) {
    return false;
  }
  auto pkey = make_secp256k1_key(signer);
  if (!pkey) {
    return false;
  }
  auto der = der_encode(*compact);
  if (!der) {
    return false;
  }
  return digest_verify(pkey.get(), EVP_sha256(),
                       bytes_view_t{der->data(), der->size()}, message);
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return available_now;
}

bool verify_signature(const bytes_view_t& message,
                      const signer_id_t& signer,
                      const signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const ed25519_signer_id& value) {
            const auto* sig = std::get_if<ed25519_signature_t>(&signature);
            return sig != nullptr && verify_ed25519(message, value, *sig);
          },
          [&](const secp256k1_signer_id& value) {
            const auto* sig = std::get_if<secp256k1_signature_t>(&signature);
            return sig != nullptr && verify_secp256k1(message, value, *sig);
          },
          [](const named_signer_t&) { return false; }},
      signer);
}

}  // namespace registrar::crypto
