#include <spdlog/spdlog.h>
#include <registrar/blake3/hash.hpp>
#include <registrar/crypto/verify.hpp>
#include <registrar/execution/engine.hpp>
#include <registrar/registry/limits.hpp>
#include <registrar/schema/key/engine_keys.hpp>
#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

using namespace registrar::schema;

namespace {

using encoder_t = registrar::execution::engine::encoder_t;

constexpr auto kCheckTxCodespace = std::string_view{"registrar.checktx"};
constexpr auto kProposalCodespace = std::string_view{"registrar.proposal"};
constexpr auto kFinalizeCodespace = std::string_view{"registrar.finalize"};
constexpr auto kExecuteCodespace = std::string_view{"registrar.execute"};
constexpr auto kQueryCodespace = std::string_view{"registrar.query"};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  encoder.encode(std::tuple{height, index}, material);
  return registrar::blake3::hash(bytes_view_t{material.data(), material.size()});
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string info,
                                       const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = to_code(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

transaction_event_attribute_t attribute(std::string key, std::string value) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = true};
}

std::string_view payload_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{[](const create_did_t&) { return "create_did"; },
                 [](const revoke_did_t&) { return "revoke_did"; },
                 [](const add_credential_t&) { return "add_credential"; },
                 [](const deactivate_did_t&) { return "deactivate_did"; },
                 [](const reactivate_did_t&) { return "reactivate_did"; },
                 [](const initiate_transfer_t&) { return "initiate_transfer"; },
                 [](const cancel_transfer_t&) { return "cancel_transfer"; },
                 [](const accept_transfer_t&) { return "accept_transfer"; }},
      payload);
}

}  // namespace

namespace registrar::execution {

bytes_t make_signing_payload(const transaction_t& tx) {
  auto encoder = encoder_t{};
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

engine::engine(encoder_t& encoder,
               storage_t& storage,
               hash32_t chain_id,
               bool require_strict_crypto,
               registrar::registry::registry_options registry_options)
    : encoder_{encoder},
      storage_{storage},
      chain_id_{chain_id},
      require_strict_crypto_{require_strict_crypto},
      registry_options_{registry_options},
      signature_verifier_{registrar::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_ && !registrar::crypto::available()) {
    spdlog::warn("OpenSSL lacks ed25519 or secp256k1; signatures will fail");
  }
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; transaction signatures are not "
                 "verified");
  }
  load_persisted_state();
  spdlog::info("Execution engine ready at height {} (chain {}, orphan policy "
               "{})",
               last_committed_height_,
               to_hex(bytes_view_t{chain_id_.data(), chain_id_.size()}),
               to_string(registry_options_.on_revoke));
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto scratch = registrar::storage::overlay{encoder_, storage_};
  return admit(raw_tx, kCheckTxCodespace, scratch);
}

std::vector<transaction_result_t> engine::process_proposal(
    const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto proposal = registrar::storage::overlay{encoder_, storage_};
  auto results = std::vector<transaction_result_t>{};
  results.reserve(txs.size());
  for (const auto& raw : txs) {
    results.push_back(admit(bytes_view_t{raw.data(), raw.size()},
                            kProposalCodespace, proposal));
  }
  return results;
}

transaction_result_t engine::admit(const bytes_view_t& raw_tx,
                                   const std::string_view codespace,
                                   registrar::storage::overlay& state) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             decode_error, codespace);
  }
  auto result = validate_transaction(*maybe_tx, codespace, state);
  if (result.code == 0) {
    stage_nonce(state, maybe_tx->signer, maybe_tx->nonce);
  }
  return result;
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace,
    const registrar::storage::overlay& state) const {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             "chain id does not match this node", codespace);
  }
  auto expected_nonce = load_nonce(state, tx.signer) + 1;
  if (tx.nonce != expected_nonce) {
    return make_error_result(transaction_error_code::invalid_nonce,
                             fmt::format("expected nonce {}, got {}",
                                         expected_nonce, tx.nonce),
                             codespace);
  }
  if (require_strict_crypto_) {
    if (std::holds_alternative<named_signer_t>(tx.signer)) {
      return make_error_result(transaction_error_code::invalid_signature_type,
                               "named signers cannot sign transactions",
                               codespace);
    }
    auto message = make_signing_payload(tx);
    if (!signature_verifier_(bytes_view_t{message.data(), message.size()},
                             tx.signer, tx.signature)) {
      return make_error_result(
          transaction_error_code::signature_verification_failed,
          "signature does not match signer", codespace);
    }
  }
  if (const auto* deactivate = std::get_if<deactivate_did_t>(&tx.payload)) {
    if (deactivate->reason &&
        deactivate->reason->size() >
            registrar::registry::kMaxRevocationReasonLength) {
      return make_error_result(transaction_error_code::invalid_payload,
                               "deactivation reason exceeds 100 characters",
                               codespace);
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(
    const transaction_t& tx,
    const uint64_t height,
    registrar::storage::overlay& state) {
  auto registry = registrar::registry::registry{state, registry_options_};
  auto ctx = registrar::registry::ledger_context{.caller = tx.signer,
                                                 .height = height};
  auto event = transaction_event_t{};
  event.type = "registrar." + std::string{payload_name(tx.payload)};
  event.attributes.push_back(attribute("owner", to_string(tx.signer)));

  auto code = std::visit(
      overloaded{
          [&](const create_did_t& payload) {
            event.attributes.push_back(attribute("did", payload.did));
            return registry.create_did(ctx, payload.did);
          },
          [&](const revoke_did_t&) { return registry.revoke_did(ctx); },
          [&](const add_credential_t& payload) {
            event.attributes.push_back(
                attribute("credential", payload.credential));
            return registry.add_credential(ctx, payload.credential);
          },
          [&](const deactivate_did_t& payload) {
            event.attributes.push_back(
                attribute("reason", payload.reason.value_or("")));
            return registry.deactivate_did(ctx, payload.reason);
          },
          [&](const reactivate_did_t&) { return registry.reactivate_did(ctx); },
          [&](const initiate_transfer_t& payload) {
            event.attributes.push_back(
                attribute("new_owner", to_string(payload.new_owner)));
            return registry.initiate_transfer(ctx, payload.new_owner);
          },
          [&](const cancel_transfer_t&) {
            return registry.cancel_transfer(ctx);
          },
          [&](const accept_transfer_t& payload) {
            event.attributes.push_back(
                attribute("current_owner", to_string(payload.current_owner)));
            return registry.accept_transfer(ctx, payload.current_owner);
          }},
      tx.payload);

  if (code != transaction_error_code::ok) {
    return make_error_result(code, std::string{payload_name(tx.payload)},
                             kExecuteCodespace);
  }
  auto result = transaction_result_t{};
  result.info = std::string{payload_name(tx.payload)};
  result.events.push_back(std::move(event));
  return result;
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  if (pending_block_) {
    spdlog::warn("Dropping uncommitted block {} before finalizing height {}",
                 pending_height_, height);
  }
  pending_block_.emplace(encoder_, storage_);

  auto rolling_root = last_committed_state_root_;
  for (auto i = std::size_t{0}; i < txs.size(); ++i) {
    const auto& raw = txs[i];
    auto state = registrar::storage::overlay{*pending_block_};
    auto tx_result = transaction_result_t{};

    auto decode_error = std::string{};
    auto maybe_tx =
        decode_transaction(bytes_view_t{raw.data(), raw.size()}, decode_error);
    if (!maybe_tx) {
      tx_result = make_error_result(transaction_error_code::invalid_transaction,
                                    decode_error, kFinalizeCodespace);
    } else {
      tx_result = validate_transaction(*maybe_tx, kFinalizeCodespace, state);
      if (tx_result.code == 0) {
        tx_result = execute_operation(*maybe_tx, height, state);
      }
      if (tx_result.code == 0) {
        stage_nonce(state, maybe_tx->signer, maybe_tx->nonce);
        rolling_root = fold_state_root(rolling_root, raw, height, i);
      } else {
        state.discard();
        spdlog::debug("Rejected tx {} at height {}: {} ({})", i, height,
                      tx_result.log, tx_result.info);
      }
    }

    auto history_key =
        key::make_history_key(encoder_, height, static_cast<uint32_t>(i));
    state.put(bytes_view_t{history_key.data(), history_key.size()},
              history_entry_t{.height = height,
                              .index = static_cast<uint32_t>(i),
                              .code = tx_result.code,
                              .tx = raw});
    state.commit();
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }
  auto writes = pending_block_ ? pending_block_->take_writes()
                               : std::vector<registrar::storage::write_entry_t>{};
  pending_block_.reset();
  storage_.commit_block(std::move(writes),
                        registrar::storage::committed_state{
                            .height = last_committed_height_,
                            .state_root = last_committed_state_root_});
  spdlog::info("Committed height {}", last_committed_height_);

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};
  result.key = make_bytes(data);

  if (path == "/engine/info") {
    result.value = encoder_.encode(
        std::tuple{last_committed_height_, last_committed_state_root_,
                   chain_id_});
    return result;
  }
  if (path == "/engine/keyspaces") {
    auto keyspaces = std::vector<std::string>{};
    std::transform(std::begin(key::kEngineKeyspaces),
                   std::end(key::kEngineKeyspaces),
                   std::back_inserter(keyspaces),
                   [](const std::string_view value) {
                     return std::string{value};
                   });
    result.value = encoder_.encode(keyspaces);
    return result;
  }
  if (path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE tuple<u64, u64>",
                              last_committed_height_);
    }
    result.value = encoder_.encode(
        load_history(std::get<0>(*range), std::get<1>(*range)));
    return result;
  }

  // Registry reads see committed storage only; the overlay is never committed.
  auto state = registrar::storage::overlay{encoder_, storage_};
  auto registry = registrar::registry::registry{state, registry_options_};

  if (path == "/credential/verify") {
    auto request = encoder_.try_decode<std::tuple<signer_id_t, std::string>>(data);
    if (!request) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE tuple<signer, string>",
                              last_committed_height_);
    }
    result.value = encoder_.encode(
        registry.verify_credential(std::get<0>(*request), std::get<1>(*request)));
    return result;
  }

  auto owner = encoder_.try_decode<signer_id_t>(data);
  if (path == "/identity/did" || path == "/identity/active" ||
      path == "/transfer/pending" || path == "/transfer/expired" ||
      path == "/transfer/history") {
    if (!owner) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE signer id",
                              last_committed_height_);
    }
  } else {
    return make_query_error(query_error_code::unsupported_path,
                            "unsupported query path", last_committed_height_);
  }

  if (path == "/identity/did") {
    auto record = registry.get_did(*owner);
    if (!record) {
      return make_query_error(query_error_code::not_found, "no identity",
                              last_committed_height_);
    }
    result.value = encoder_.encode(*record);
  } else if (path == "/identity/active") {
    result.value = encoder_.encode(registry.is_did_active(*owner));
  } else if (path == "/transfer/pending") {
    auto pending = registry.get_pending_transfer(*owner);
    if (!pending) {
      return make_query_error(query_error_code::not_found,
                              "no pending transfer", last_committed_height_);
    }
    result.value = encoder_.encode(*pending);
  } else if (path == "/transfer/expired") {
    result.value = encoder_.encode(registry.is_transfer_expired(
        *owner, static_cast<height_t>(last_committed_height_)));
  } else {
    result.value = encoder_.encode(registry.get_transfer_history(*owner));
  }
  return result;
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return load_history(from_height, to_height);
}

std::vector<history_entry_t> engine::load_history(
    const uint64_t from_height,
    const uint64_t to_height) const {
  auto out = std::vector<history_entry_t>{};
  if (from_height > to_height) {
    return out;
  }
  auto prefix = key::make_prefix_key(encoder_, key::kHistoryPrefix);
  for (const auto& [raw_key, value] :
       storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    auto parsed = key::parse_history_key(
        encoder_, bytes_view_t{raw_key.data(), raw_key.size()});
    if (!parsed) {
      spdlog::warn("Skipping malformed history key");
      continue;
    }
    if (parsed->first < from_height) {
      continue;
    }
    if (parsed->first > to_height) {
      break;
    }
    out.push_back(encoder_.decode<history_entry_t>(
        bytes_view_t{value.data(), value.size()}));
  }
  return out;
}

replay_result_t engine::replay_history() {
  auto lock = std::scoped_lock{mutex_};
  auto result = replay_result_t{};
  if (last_committed_height_ <= 0) {
    result.ok = true;
    result.state_root = last_committed_state_root_;
    return result;
  }

  auto rows = load_history(1, static_cast<uint64_t>(last_committed_height_));
  auto root = make_zero_hash();
  for (const auto& row : rows) {
    ++result.tx_count;
    if (row.code != 0) {
      continue;
    }
    root = fold_state_root(root, row.tx, row.height, row.index);
    ++result.applied_count;
    result.last_height = static_cast<int64_t>(row.height);
  }
  result.state_root = root;
  result.ok = root == last_committed_state_root_;
  if (!result.ok) {
    result.error = "replayed state root does not match committed state root";
    spdlog::error("History replay mismatch after {} transaction(s)",
                  result.tx_count);
  }
  return result;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::debug("Ignoring signature verifier; strict crypto is disabled");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

const hash32_t& engine::chain_id() const {
  return chain_id_;
}

uint64_t engine::load_nonce(const registrar::storage::overlay& state,
                            const signer_id_t& signer) const {
  auto nonce_key = key::make_nonce_key(encoder_, signer);
  return state.get<uint64_t>(bytes_view_t{nonce_key.data(), nonce_key.size()})
      .value_or(0);
}

void engine::stage_nonce(registrar::storage::overlay& state,
                         const signer_id_t& signer,
                         const uint64_t nonce) const {
  auto nonce_key = key::make_nonce_key(encoder_, signer);
  state.put(bytes_view_t{nonce_key.data(), nonce_key.size()}, nonce);
}

void engine::load_persisted_state() {
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    spdlog::info("Loaded committed state at height {}", committed->height);
  } else {
    last_committed_state_root_ = make_zero_hash();
    storage_.save_committed_state(registrar::storage::committed_state{
        .height = 0, .state_root = last_committed_state_root_});
  }
  pending_state_root_ = last_committed_state_root_;
}

}  // namespace registrar::execution
