#pragma once

#include <registrar/abci/types.grpc.pb.h>
#include <registrar/execution/engine.hpp>

namespace registrar::abci {

/// ABCI callback listener used by CometBFT to drive the registry.
///
/// - Echo/Flush: liveness and flush barriers.
/// - Info/InitChain: handshake and initial state root exchange.
/// - CheckTx: mempool admission checks; no state mutation.
/// - PrepareProposal: proposer-side tx filtering under max-bytes.
/// - ProcessProposal: validator-side proposal accept/reject decision.
/// - FinalizeBlock: execute block and return tx results + state root.
/// - Commit: persist finalized state.
struct listener final : public registrar::abci::ABCI::CallbackService {
  explicit listener(registrar::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Echo(
      grpc::CallbackServerContext* context,
      const registrar::abci::RequestEcho* request,
      registrar::abci::ResponseEcho* response) override final;

  virtual grpc::ServerUnaryReactor* Flush(
      grpc::CallbackServerContext* context,
      const registrar::abci::RequestFlush* request,
      registrar::abci::ResponseFlush* response) override final;

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const registrar::abci::RequestInfo* request,
      registrar::abci::ResponseInfo* response) override final;

  virtual grpc::ServerUnaryReactor* InitChain(
      grpc::CallbackServerContext* context,
      const registrar::abci::RequestInitChain* request,
      registrar::abci::ResponseInitChain* response) override final;

  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const registrar::abci::RequestCheckTx* request,
      registrar::abci::ResponseCheckTx* response) override final;

  /// Read-path query against committed state.
  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const registrar::abci::RequestQuery* request,
      registrar::abci::ResponseQuery* response) override final;

  virtual grpc::ServerUnaryReactor* PrepareProposal(
      grpc::CallbackServerContext* context,
      const registrar::abci::RequestPrepareProposal* request,
      registrar::abci::ResponsePrepareProposal* response) override final;

  /// Rejects the whole proposal when any transaction fails validation.
  virtual grpc::ServerUnaryReactor* ProcessProposal(
      grpc::CallbackServerContext* context,
      const registrar::abci::RequestProcessProposal* request,
      registrar::abci::ResponseProcessProposal* response) override final;

  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const registrar::abci::RequestFinalizeBlock* request,
      registrar::abci::ResponseFinalizeBlock* response) override final;

  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const registrar::abci::RequestCommit* request,
      registrar::abci::ResponseCommit* response) override final;

  registrar::execution::engine& execution_engine_;
};

/// Copy an engine result into its protobuf counterpart.
void populate_exec_tx_result(const registrar::schema::transaction_result_t& source,
                             registrar::abci::ExecTxResult* destination);

}  // namespace registrar::abci
