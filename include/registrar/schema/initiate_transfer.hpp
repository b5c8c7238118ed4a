#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>

// Schema type: initiate_transfer payload.
// Registry workflow: offer the signer's record to another owner.
namespace registrar::schema {

template <uint16_t Version>
struct initiate_transfer;

template <>
struct initiate_transfer<1> final {
  uint16_t version{1};
  signer_id_t new_owner{};
};

using initiate_transfer_t = initiate_transfer<1>;

}  // namespace registrar::schema
