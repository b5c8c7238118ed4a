#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: add_credential payload.
// Registry workflow: append one credential statement to the signer's
// record.
namespace registrar::schema {

template <uint16_t Version>
struct add_credential;

template <>
struct add_credential<1> final {
  uint16_t version{1};
  std::string credential;
};

using add_credential_t = add_credential<1>;

}  // namespace registrar::schema
