#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>

// Schema type: transfer history entry.
// Registry workflow: one completed handoff, appended to the recipient's log.
namespace registrar::schema {

template <uint16_t Version>
struct transfer_history_entry;

template <>
struct transfer_history_entry<1> final {
  uint16_t version{1};
  signer_id_t from{};
  signer_id_t to{};
  height_t timestamp{};
};

using transfer_history_entry_t = transfer_history_entry<1>;

}  // namespace registrar::schema
