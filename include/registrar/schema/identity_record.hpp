#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: identity record.
// Registry workflow: the single DID claimed by an owner together with its
// append-only credential list and lifecycle status.
namespace registrar::schema {

template <uint16_t Version>
struct identity_record;

template <>
struct identity_record<1> final {
  uint16_t version{1};
  std::string did;
  std::vector<std::string> credentials;
  height_t created_at{};
  height_t updated_at{};
  bool is_active{true};
  std::optional<std::string> revocation_reason;
};

using identity_record_t = identity_record<1>;

}  // namespace registrar::schema
