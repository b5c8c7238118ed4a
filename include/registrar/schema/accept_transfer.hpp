#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>

// Schema type: accept_transfer payload.
// Registry workflow: take over the record offered by current_owner.
namespace registrar::schema {

template <uint16_t Version>
struct accept_transfer;

template <>
struct accept_transfer<1> final {
  uint16_t version{1};
  signer_id_t current_owner{};
};

using accept_transfer_t = accept_transfer<1>;

}  // namespace registrar::schema
