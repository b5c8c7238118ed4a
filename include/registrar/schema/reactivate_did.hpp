#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>

// Schema type: reactivate_did payload.
// Registry workflow: return a deactivated record to active and clear
// the stored reason.
namespace registrar::schema {

template <uint16_t Version>
struct reactivate_did;

template <>
struct reactivate_did<1> final {
  uint16_t version{1};
};

using reactivate_did_t = reactivate_did<1>;

}  // namespace registrar::schema
