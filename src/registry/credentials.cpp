#include <registrar/registry/limits.hpp>
#include <registrar/registry/registry.hpp>
#include <algorithm>

using namespace registrar::schema;

namespace registrar::registry {

bool is_valid_credential(const std::string_view credential) {
  return !credential.empty() && credential.size() <= kMaxCredentialLength;
}

transaction_error_code registry::add_credential(
    const ledger_context& ctx,
    const std::string_view credential) {
  auto record = load_identity(ctx.caller);
  if (!record) {
    return transaction_error_code::not_found;
  }
  if (!record->is_active) {
    return transaction_error_code::deactivated;
  }
  if (!is_valid_credential(credential)) {
    return transaction_error_code::invalid_credential_format;
  }
  // Full vaults reject; entries are never rotated out.
  if (record->credentials.size() >= kMaxCredentials) {
    return transaction_error_code::max_credentials;
  }
  record->credentials.emplace_back(credential);
  record->updated_at = ctx.height;
  store_identity(ctx.caller, *record);
  return transaction_error_code::ok;
}

bool registry::verify_credential(const signer_id_t& owner,
                                 const std::string_view credential) const {
  auto record = load_identity(owner);
  if (!record || !record->is_active) {
    return false;
  }
  return std::find(std::begin(record->credentials),
                   std::end(record->credentials),
                   credential) != std::end(record->credentials);
}

}  // namespace registrar::registry
