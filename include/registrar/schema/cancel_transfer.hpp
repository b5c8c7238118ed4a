#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>

// Schema type: cancel_transfer payload.
// Registry workflow: withdraw the signer's outstanding offer.
namespace registrar::schema {

template <uint16_t Version>
struct cancel_transfer;

template <>
struct cancel_transfer<1> final {
  uint16_t version{1};
};

using cancel_transfer_t = cancel_transfer<1>;

}  // namespace registrar::schema
