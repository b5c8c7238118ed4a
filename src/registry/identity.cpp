#include <registrar/registry/limits.hpp>
#include <registrar/registry/registry.hpp>
#include <registrar/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

using namespace registrar::schema;

namespace registrar::registry {

bool is_valid_did(const std::string_view did) {
  return !did.empty() && did.size() <= kMaxDidLength &&
         did.starts_with(kDidMethodPrefix);
}

registry::registry(registrar::storage::overlay& state,
                   registry_options options)
    : state_{state}, options_{options} {}

transaction_error_code registry::create_did(const ledger_context& ctx,
                                            const std::string_view did) {
  if (load_identity(ctx.caller)) {
    return transaction_error_code::already_exists;
  }
  if (!is_valid_did(did)) {
    return transaction_error_code::invalid_did_format;
  }
  store_identity(ctx.caller, identity_record_t{.did = std::string{did},
                                               .credentials = {},
                                               .created_at = ctx.height,
                                               .updated_at = ctx.height,
                                               .is_active = true,
                                               .revocation_reason = {}});
  spdlog::debug("Created '{}' for {}", did, to_string(ctx.caller));
  return transaction_error_code::ok;
}

std::optional<identity_record_t> registry::get_did(
    const signer_id_t& owner) const {
  return load_identity(owner);
}

transaction_error_code registry::revoke_did(const ledger_context& ctx) {
  auto record = load_identity(ctx.caller);
  if (!record) {
    return transaction_error_code::not_found;
  }
  erase_identity(ctx.caller);
  if (options_.on_revoke == orphan_policy_t::cascade) {
    erase_pending_transfer(ctx.caller);
    erase_history(ctx.caller);
  }
  spdlog::debug("Revoked '{}' for {} (orphan policy {})", record->did,
                to_string(ctx.caller), to_string(options_.on_revoke));
  return transaction_error_code::ok;
}

std::optional<identity_record_t> registry::load_identity(
    const signer_id_t& owner) const {
  auto key = key::make_identity_key(state_.encoder(), owner);
  return state_.get<identity_record_t>(bytes_view_t{key.data(), key.size()});
}

void registry::store_identity(const signer_id_t& owner,
                              const identity_record_t& record) {
  auto key = key::make_identity_key(state_.encoder(), owner);
  state_.put(bytes_view_t{key.data(), key.size()}, record);
}

void registry::erase_identity(const signer_id_t& owner) {
  auto key = key::make_identity_key(state_.encoder(), owner);
  state_.erase(bytes_view_t{key.data(), key.size()});
}

}  // namespace registrar::registry
