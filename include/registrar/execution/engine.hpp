#pragma once

#include <registrar/execution/signature_verifier.hpp>
#include <registrar/registry/registry.hpp>
#include <registrar/schema/app_info.hpp>
#include <registrar/schema/block_result.hpp>
#include <registrar/schema/commit_result.hpp>
#include <registrar/schema/encoding/scale/encoder.hpp>
#include <registrar/schema/history_entry.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/schema/query_result.hpp>
#include <registrar/schema/replay_result.hpp>
#include <registrar/schema/transaction.hpp>
#include <registrar/schema/transaction_error_code.hpp>
#include <registrar/schema/transaction_result.hpp>
#include <registrar/storage/rocksdb/overlay.hpp>
#include <registrar/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace registrar::execution {

/// Bytes covered by a transaction signature: the SCALE encoding of
/// {version, chain_id, nonce, signer, payload}.
registrar::schema::bytes_t make_signing_payload(
    const registrar::schema::transaction_t& tx);

/// Deterministic identity registry state machine used by the ABCI server.
///
/// The engine authenticates transactions, hands the signer and block height
/// to the registry as the trusted ledger context, persists state and history,
/// and serves the read-path queries. All public calls are serialized.
class engine final {
 public:
  using encoder_t = registrar::schema::encoding::encoder<
      registrar::schema::encoding::scale_encoder_tag>;
  using storage_t =
      registrar::storage::storage<registrar::storage::rocksdb_storage_tag>;

  /// `require_strict_crypto` enables real signature verification; when false,
  /// signatures are not checked.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  registrar::schema::hash32_t chain_id,
                  bool require_strict_crypto = true,
                  registrar::registry::registry_options registry_options = {});

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Performs decode + validation checks only; does not mutate application
  /// state.
  registrar::schema::transaction_result_t check_transaction(
      const registrar::schema::bytes_view_t& raw_tx);

  /// Validate the transactions of a proposed block in order.
  ///
  /// Each accepted transaction advances its signer's expected nonce for the
  /// rest of the proposal, so one signer may appear several times. Payloads
  /// are not executed and nothing is persisted.
  std::vector<registrar::schema::transaction_result_t> process_proposal(
      const std::vector<registrar::schema::bytes_t>& txs);

  /// Execute a block in order and compute its resulting state_root.
  ///
  /// Each successful transaction is staged together with its nonce bump and
  /// history row. Failed transactions only stage a history row. Nothing
  /// reaches storage until `commit`; finalizing again before `commit` drops
  /// the staged block.
  registrar::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<registrar::schema::bytes_t>& txs);

  /// Persist the staged block together with its height and state_root.
  registrar::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  registrar::schema::app_info_t info() const;

  /// Execute a read-path query by route.
  registrar::schema::query_result_t query(
      std::string_view path,
      const registrar::schema::bytes_view_t& data);

  /// Return history entries in the inclusive height range.
  std::vector<registrar::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Re-fold persisted history and check state-root agreement.
  registrar::schema::replay_result_t replay_history();

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  const registrar::schema::hash32_t& chain_id() const;

 private:
  registrar::schema::transaction_result_t execute_operation(
      const registrar::schema::transaction_t& tx,
      uint64_t height,
      registrar::storage::overlay& state);

  /// Validate envelope, nonce, signature and payload bounds. The expected
  /// nonce is read through `state`.
  registrar::schema::transaction_result_t validate_transaction(
      const registrar::schema::transaction_t& tx,
      std::string_view codespace,
      const registrar::storage::overlay& state) const;

  /// Decode and validate; on success stage the nonce bump into `state`.
  registrar::schema::transaction_result_t admit(
      const registrar::schema::bytes_view_t& raw_tx,
      std::string_view codespace,
      registrar::storage::overlay& state);

  uint64_t load_nonce(const registrar::storage::overlay& state,
                      const registrar::schema::signer_id_t& signer) const;
  void stage_nonce(registrar::storage::overlay& state,
                   const registrar::schema::signer_id_t& signer,
                   uint64_t nonce) const;

  std::vector<registrar::schema::history_entry_t> load_history(
      uint64_t from_height,
      uint64_t to_height) const;

  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  registrar::schema::hash32_t chain_id_;
  bool require_strict_crypto_{true};
  registrar::registry::registry_options registry_options_;
  signature_verifier_t signature_verifier_;
  int64_t last_committed_height_{};
  registrar::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  registrar::schema::hash32_t pending_state_root_{};
  std::optional<registrar::storage::overlay> pending_block_;
};

}  // namespace registrar::execution
