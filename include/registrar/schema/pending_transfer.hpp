#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>

// Schema type: pending transfer.
// Registry workflow: outstanding ownership handoff offered by the current
// owner. Stored under the current owner; at most one per owner.
namespace registrar::schema {

template <uint16_t Version>
struct pending_transfer;

template <>
struct pending_transfer<1> final {
  uint16_t version{1};
  signer_id_t new_owner{};
  height_t initiated_at{};
  height_t expires_at{};
};

using pending_transfer_t = pending_transfer<1>;

}  // namespace registrar::schema
