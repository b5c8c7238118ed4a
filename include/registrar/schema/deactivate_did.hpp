#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: deactivate_did payload.
// Registry workflow: mark the signer's record inactive with an
// optional reason.
namespace registrar::schema {

template <uint16_t Version>
struct deactivate_did;

template <>
struct deactivate_did<1> final {
  uint16_t version{1};
  std::optional<std::string> reason;
};

using deactivate_did_t = deactivate_did<1>;

}  // namespace registrar::schema
