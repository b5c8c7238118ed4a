#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>

// Schema type: revoke_did payload.
// Registry workflow: delete the signer's identity record.
namespace registrar::schema {

template <uint16_t Version>
struct revoke_did;

template <>
struct revoke_did<1> final {
  uint16_t version{1};
};

using revoke_did_t = revoke_did<1>;

}  // namespace registrar::schema
