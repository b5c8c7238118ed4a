#pragma once

#include <registrar/registry/ledger_context.hpp>
#include <registrar/schema/identity_record.hpp>
#include <registrar/schema/orphan_policy.hpp>
#include <registrar/schema/pending_transfer.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/schema/transaction_error_code.hpp>
#include <registrar/schema/transfer_history_entry.hpp>
#include <registrar/storage/rocksdb/overlay.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace registrar::registry {

struct registry_options final {
  /// What happens to the revoked owner's pending transfer and transfer
  /// history when `revoke_did` deletes the record.
  registrar::schema::orphan_policy_t on_revoke{
      registrar::schema::orphan_policy_t::preserve};
};

/// Identity, credential, lifecycle and transfer state machine.
///
/// Every mutating call either returns `transaction_error_code::ok` after
/// staging its writes in the overlay, or returns a failure code having staged
/// nothing. Callers own the overlay and decide when to commit it.
class registry final {
 public:
  explicit registry(registrar::storage::overlay& state,
                    registry_options options = {});

  // Identity registry.
  registrar::schema::transaction_error_code create_did(
      const ledger_context& ctx,
      std::string_view did);
  std::optional<registrar::schema::identity_record_t> get_did(
      const registrar::schema::signer_id_t& owner) const;
  registrar::schema::transaction_error_code revoke_did(
      const ledger_context& ctx);

  // Credential vault.
  registrar::schema::transaction_error_code add_credential(
      const ledger_context& ctx,
      std::string_view credential);
  bool verify_credential(const registrar::schema::signer_id_t& owner,
                         std::string_view credential) const;

  // Lifecycle.
  registrar::schema::transaction_error_code deactivate_did(
      const ledger_context& ctx,
      const std::optional<std::string>& reason);
  registrar::schema::transaction_error_code reactivate_did(
      const ledger_context& ctx);
  bool is_did_active(const registrar::schema::signer_id_t& owner) const;

  // Transfer coordinator.
  registrar::schema::transaction_error_code initiate_transfer(
      const ledger_context& ctx,
      const registrar::schema::signer_id_t& new_owner);
  registrar::schema::transaction_error_code cancel_transfer(
      const ledger_context& ctx);
  registrar::schema::transaction_error_code accept_transfer(
      const ledger_context& ctx,
      const registrar::schema::signer_id_t& current_owner);
  std::optional<registrar::schema::pending_transfer_t> get_pending_transfer(
      const registrar::schema::signer_id_t& owner) const;
  bool is_transfer_expired(const registrar::schema::signer_id_t& owner,
                           registrar::schema::height_t height) const;

  // Transfer history log.
  std::vector<registrar::schema::transfer_history_entry_t>
  get_transfer_history(const registrar::schema::signer_id_t& owner) const;

 private:
  std::optional<registrar::schema::identity_record_t> load_identity(
      const registrar::schema::signer_id_t& owner) const;
  void store_identity(const registrar::schema::signer_id_t& owner,
                      const registrar::schema::identity_record_t& record);
  void erase_identity(const registrar::schema::signer_id_t& owner);

  std::optional<registrar::schema::pending_transfer_t> load_pending_transfer(
      const registrar::schema::signer_id_t& owner) const;
  void store_pending_transfer(
      const registrar::schema::signer_id_t& owner,
      const registrar::schema::pending_transfer_t& transfer);
  void erase_pending_transfer(const registrar::schema::signer_id_t& owner);

  std::vector<registrar::schema::transfer_history_entry_t> load_history(
      const registrar::schema::signer_id_t& owner) const;
  void store_history(
      const registrar::schema::signer_id_t& owner,
      const std::vector<registrar::schema::transfer_history_entry_t>& history);
  void erase_history(const registrar::schema::signer_id_t& owner);

  registrar::storage::overlay& state_;
  registry_options options_;
};

/// Format contract for a DID: non-empty, bounded, method-prefixed.
bool is_valid_did(std::string_view did);

/// Format contract for a credential statement: non-empty, bounded.
bool is_valid_credential(std::string_view credential);

}  // namespace registrar::registry
