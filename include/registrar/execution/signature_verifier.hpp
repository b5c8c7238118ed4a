#pragma once

#include <registrar/schema/primitives.hpp>
#include <functional>

namespace registrar::execution {

/// Checks a transaction signature over `make_signing_payload(tx)`.
///
/// The engine only consults it in strict-crypto mode, after rejecting named
/// signers, so `signer` is always an ed25519 or secp256k1 key. The default is
/// `registrar::crypto::verify_signature`; tests install their own.
using signature_verifier_t =
    std::function<bool(const registrar::schema::bytes_view_t& message,
                       const registrar::schema::signer_id_t& signer,
                       const registrar::schema::signature_t& signature)>;

}  // namespace registrar::execution
