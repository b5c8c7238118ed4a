#include <spdlog/spdlog.h>
#include <registrar/abci/server.hpp>
#include <cstddef>
#include <string>
#include <vector>

using namespace registrar::abci;
using namespace registrar::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

void populate_event(const transaction_event_t& source,
                    registrar::abci::Event* destination) {
  destination->set_type(source.type);
  for (const auto& attribute : source.attributes) {
    auto* out = destination->add_attributes();
    out->set_key(attribute.key);
    out->set_value(attribute.value);
    out->set_index(attribute.index);
  }
}

std::vector<bytes_t> make_txs(
    const google::protobuf::RepeatedPtrField<std::string>& raw_txs) {
  auto txs = std::vector<bytes_t>{};
  txs.reserve(static_cast<std::size_t>(raw_txs.size()));
  for (const auto& tx : raw_txs) {
    txs.push_back(make_bytes(tx));
  }
  return txs;
}

}  // namespace

namespace registrar::abci {

void populate_exec_tx_result(const transaction_result_t& source,
                             registrar::abci::ExecTxResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_gas_wanted(source.gas_wanted);
  destination->set_gas_used(source.gas_used);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    populate_event(event, destination->add_events());
  }
}

}  // namespace registrar::abci

listener::listener(registrar::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Echo(
    grpc::CallbackServerContext* context,
    const registrar::abci::RequestEcho* request,
    registrar::abci::ResponseEcho* response) {
  response->set_message(request->message());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Flush(
    grpc::CallbackServerContext* context,
    const registrar::abci::RequestFlush* /*request*/,
    registrar::abci::ResponseFlush* /*response*/) {
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const registrar::abci::RequestInfo* request,
    registrar::abci::ResponseInfo* response) {
  auto info = execution_engine_.info();
  spdlog::debug("Info handshake from CometBFT {}", request->version());
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_app_hash(make_string(bytes_t{
      std::begin(info.last_block_state_root),
      std::end(info.last_block_state_root)}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::InitChain(
    grpc::CallbackServerContext* context,
    const registrar::abci::RequestInitChain* request,
    registrar::abci::ResponseInitChain* response) {
  spdlog::info("InitChain '{}' at initial height {}", request->chain_id(),
               request->initial_height());
  auto info = execution_engine_.info();
  response->set_app_hash(make_string(bytes_t{
      std::begin(info.last_block_state_root),
      std::end(info.last_block_state_root)}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const registrar::abci::RequestCheckTx* request,
    registrar::abci::ResponseCheckTx* response) {
  auto tx = make_bytes(request->tx());
  auto check =
      execution_engine_.check_transaction(bytes_view_t{tx.data(), tx.size()});
  response->set_code(check.code);
  response->set_data(make_string(check.data));
  response->set_log(check.log);
  response->set_info(check.info);
  response->set_gas_wanted(check.gas_wanted);
  response->set_gas_used(check.gas_used);
  response->set_codespace(check.codespace);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const registrar::abci::RequestQuery* request,
    registrar::abci::ResponseQuery* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(),
                                       bytes_view_t{data.data(), data.size()});
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::PrepareProposal(
    grpc::CallbackServerContext* context,
    const registrar::abci::RequestPrepareProposal* request,
    registrar::abci::ResponsePrepareProposal* response) {
  auto total_size = int64_t{};
  auto max_bytes = request->max_tx_bytes();
  auto results = execution_engine_.process_proposal(make_txs(request->txs()));
  for (auto i = 0; i < request->txs_size(); ++i) {
    const auto& tx = request->txs(i);
    if (results[static_cast<std::size_t>(i)].code != 0) {
      continue;
    }
    auto next_size = total_size + static_cast<int64_t>(tx.size());
    if (max_bytes > 0 && next_size > max_bytes) {
      break;
    }
    total_size = next_size;
    *response->add_txs() = tx;
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ProcessProposal(
    grpc::CallbackServerContext* context,
    const registrar::abci::RequestProcessProposal* request,
    registrar::abci::ResponseProcessProposal* response) {
  for (const auto& tx_result :
       execution_engine_.process_proposal(make_txs(request->txs()))) {
    if (tx_result.code != 0) {
      spdlog::debug("Rejecting proposal at height {}: {}", request->height(),
                    tx_result.log);
      response->set_status(
          registrar::abci::ResponseProcessProposal_ProposalStatus_REJECT);
      return finish_ok(context);
    }
  }
  response->set_status(
      registrar::abci::ResponseProcessProposal_ProposalStatus_ACCEPT);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::FinalizeBlock(
    grpc::CallbackServerContext* context,
    const registrar::abci::RequestFinalizeBlock* request,
    registrar::abci::ResponseFinalizeBlock* response) {
  auto execution = execution_engine_.finalize_block(
      static_cast<uint64_t>(request->height()), make_txs(request->txs()));
  for (const auto& tx_result : execution.tx_results) {
    populate_exec_tx_result(tx_result, response->add_tx_results());
  }
  response->set_app_hash(make_string(bytes_t{std::begin(execution.state_root),
                                             std::end(execution.state_root)}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Commit(
    grpc::CallbackServerContext* context,
    const registrar::abci::RequestCommit* /*request*/,
    registrar::abci::ResponseCommit* response) {
  auto commit = execution_engine_.commit();
  response->set_retain_height(commit.retain_height);
  return finish_ok(context);
}
