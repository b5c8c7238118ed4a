#pragma once
#include <registrar/schema/accept_transfer.hpp>
#include <registrar/schema/add_credential.hpp>
#include <registrar/schema/cancel_transfer.hpp>
#include <registrar/schema/create_did.hpp>
#include <registrar/schema/deactivate_did.hpp>
#include <registrar/schema/initiate_transfer.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/schema/reactivate_did.hpp>
#include <registrar/schema/revoke_did.hpp>
#include <variant>

namespace registrar::schema {

// Alternative order is part of the wire format; append only.
using transaction_payload_t = std::variant<create_did_t,
                                           revoke_did_t,
                                           add_credential_t,
                                           deactivate_did_t,
                                           reactivate_did_t,
                                           initiate_transfer_t,
                                           cancel_transfer_t,
                                           accept_transfer_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace registrar::schema
