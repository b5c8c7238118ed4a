#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: create_did payload.
// Registry workflow: claim a DID for the signer.
namespace registrar::schema {

template <uint16_t Version>
struct create_did;

template <>
struct create_did<1> final {
  uint16_t version{1};
  std::string did;
};

using create_did_t = create_did<1>;

}  // namespace registrar::schema
