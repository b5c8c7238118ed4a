#pragma once

#include <registrar/schema/primitives.hpp>

namespace registrar::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

/// Verify `signature` over `message` for `signer`. Named signers carry no key
/// material and never verify.
bool verify_signature(const registrar::schema::bytes_view_t& message,
                      const registrar::schema::signer_id_t& signer,
                      const registrar::schema::signature_t& signature);

}  // namespace registrar::crypto
