#pragma once

#include <registrar/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: orphan policy.
// Registry workflow: decides what happens to the pending transfer and
// transfer history keyed by an owner when that owner revokes their DID.
namespace registrar::schema {

enum class orphan_policy_t : uint8_t {
  // Leave pending transfer and history in place; a later create_did by the
  // same owner inherits them.
  preserve = 0,
  // Delete pending transfer and history together with the identity record.
  cascade = 1
};

inline constexpr auto kOrphanPolicyMappings =
    enum_mappings_t<orphan_policy_t, 2>{
        std::pair<std::string_view, orphan_policy_t>{
            "preserve", orphan_policy_t::preserve},
        std::pair<std::string_view, orphan_policy_t>{
            "cascade", orphan_policy_t::cascade}};

template <>
inline std::optional<orphan_policy_t> try_from_string<orphan_policy_t>(
    const std::string_view value) {
  return from_string(value, kOrphanPolicyMappings);
}

inline constexpr std::string_view to_string(const orphan_policy_t value) {
  return to_string(value, kOrphanPolicyMappings).value_or("unknown");
}

}  // namespace registrar::schema
