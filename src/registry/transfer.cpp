#include <registrar/registry/limits.hpp>
#include <registrar/registry/registry.hpp>
#include <registrar/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

using namespace registrar::schema;

namespace registrar::registry {

transaction_error_code registry::initiate_transfer(
    const ledger_context& ctx,
    const signer_id_t& new_owner) {
  auto record = load_identity(ctx.caller);
  if (!record) {
    return transaction_error_code::not_found;
  }
  if (!record->is_active) {
    return transaction_error_code::deactivated;
  }
  if (load_pending_transfer(ctx.caller)) {
    return transaction_error_code::transfer_in_progress;
  }
  if (new_owner == ctx.caller) {
    return transaction_error_code::self_transfer;
  }
  if (load_identity(new_owner)) {
    return transaction_error_code::already_exists;
  }
  store_pending_transfer(
      ctx.caller, pending_transfer_t{.new_owner = new_owner,
                                     .initiated_at = ctx.height,
                                     .expires_at = ctx.height + kTransferWindow});
  return transaction_error_code::ok;
}

transaction_error_code registry::cancel_transfer(const ledger_context& ctx) {
  if (!load_pending_transfer(ctx.caller)) {
    return transaction_error_code::no_pending_transfer;
  }
  erase_pending_transfer(ctx.caller);
  return transaction_error_code::ok;
}

transaction_error_code registry::accept_transfer(
    const ledger_context& ctx,
    const signer_id_t& current_owner) {
  auto pending = load_pending_transfer(current_owner);
  if (!pending) {
    return transaction_error_code::not_found;
  }
  auto record = load_identity(current_owner);
  if (!record) {
    return transaction_error_code::not_found;
  }
  if (pending->new_owner != ctx.caller) {
    return transaction_error_code::unauthorized;
  }
  if (!record->is_active) {
    return transaction_error_code::deactivated;
  }
  // Expired offers stay stored until the owner cancels them.
  if (ctx.height > pending->expires_at) {
    return transaction_error_code::transfer_expired;
  }
  auto history = load_history(ctx.caller);
  if (history.size() >= kMaxTransferHistory) {
    return transaction_error_code::history_full;
  }

  record->updated_at = ctx.height;
  history.push_back(transfer_history_entry_t{
      .from = current_owner, .to = ctx.caller, .timestamp = ctx.height});

  store_identity(ctx.caller, *record);
  store_history(ctx.caller, history);
  erase_identity(current_owner);
  erase_pending_transfer(current_owner);
  spdlog::debug("Transferred '{}' from {} to {}", record->did,
                to_string(current_owner), to_string(ctx.caller));
  return transaction_error_code::ok;
}

std::optional<pending_transfer_t> registry::get_pending_transfer(
    const signer_id_t& owner) const {
  return load_pending_transfer(owner);
}

bool registry::is_transfer_expired(const signer_id_t& owner,
                                   const height_t height) const {
  auto pending = load_pending_transfer(owner);
  return pending && height > pending->expires_at;
}

std::optional<pending_transfer_t> registry::load_pending_transfer(
    const signer_id_t& owner) const {
  auto key = key::make_pending_transfer_key(state_.encoder(), owner);
  return state_.get<pending_transfer_t>(bytes_view_t{key.data(), key.size()});
}

void registry::store_pending_transfer(const signer_id_t& owner,
                                      const pending_transfer_t& transfer) {
  auto key = key::make_pending_transfer_key(state_.encoder(), owner);
  state_.put(bytes_view_t{key.data(), key.size()}, transfer);
}

void registry::erase_pending_transfer(const signer_id_t& owner) {
  auto key = key::make_pending_transfer_key(state_.encoder(), owner);
  state_.erase(bytes_view_t{key.data(), key.size()});
}

}  // namespace registrar::registry
