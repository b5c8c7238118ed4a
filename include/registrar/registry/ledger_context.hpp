#pragma once

#include <registrar/schema/primitives.hpp>

namespace registrar::registry {

/// Trusted per-operation inputs supplied by the host ledger. The registry
/// never authenticates `caller` itself.
struct ledger_context final {
  registrar::schema::signer_id_t caller{};
  registrar::schema::height_t height{};
};

}  // namespace registrar::registry
