#include <registrar/registry/limits.hpp>
#include <registrar/registry/registry.hpp>

using namespace registrar::schema;

namespace registrar::registry {

transaction_error_code registry::deactivate_did(
    const ledger_context& ctx,
    const std::optional<std::string>& reason) {
  if (reason && reason->size() > kMaxRevocationReasonLength) {
    return transaction_error_code::invalid_payload;
  }
  auto record = load_identity(ctx.caller);
  if (!record) {
    return transaction_error_code::not_found;
  }
  if (!record->is_active) {
    return transaction_error_code::already_deactivated;
  }
  record->is_active = false;
  record->revocation_reason = reason;
  record->updated_at = ctx.height;
  store_identity(ctx.caller, *record);
  return transaction_error_code::ok;
}

// Reactivating an active record reports already_deactivated as well; the code
// means "already in the requested state" in both directions.
transaction_error_code registry::reactivate_did(const ledger_context& ctx) {
  auto record = load_identity(ctx.caller);
  if (!record) {
    return transaction_error_code::not_found;
  }
  if (record->is_active) {
    return transaction_error_code::already_deactivated;
  }
  record->is_active = true;
  record->revocation_reason.reset();
  record->updated_at = ctx.height;
  store_identity(ctx.caller, *record);
  return transaction_error_code::ok;
}

bool registry::is_did_active(const signer_id_t& owner) const {
  auto record = load_identity(owner);
  return record && record->is_active;
}

}  // namespace registrar::registry
