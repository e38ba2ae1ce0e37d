#include <spdlog/spdlog.h>
#include <oracle/abci/server.hpp>
#include <string>
#include <vector>

using namespace oracle::abci;
using namespace oracle::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

void populate_exec_tx_result(const transaction_result_t& source,
                             oracle::abci::ExecTxResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_gas_wanted(source.gas_wanted);
  destination->set_gas_used(source.gas_used);
  destination->set_codespace(source.codespace);
}

}  // namespace

listener::listener(oracle::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Echo(
    grpc::CallbackServerContext* context,
    const oracle::abci::RequestEcho* request,
    oracle::abci::ResponseEcho* response) {
  response->set_message(request->message());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const oracle::abci::RequestInfo* /*request*/,
    oracle::abci::ResponseInfo* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_app_hash(make_string(info.last_block_state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const oracle::abci::RequestCheckTx* request,
    oracle::abci::ResponseCheckTx* response) {
  auto tx = make_bytes(request->tx());
  auto check = execution_engine_.check_transaction(make_bytes_view(tx));
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
    const oracle::abci::RequestQuery* request,
    oracle::abci::ResponseQuery* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(), make_bytes_view(data));
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
    const oracle::abci::RequestPrepareProposal* request,
    oracle::abci::ResponsePrepareProposal* response) {
  auto total_size = int64_t{};
  auto max_bytes = request->max_tx_bytes();
  for (const auto& tx : request->txs()) {
    auto tx_bytes = make_bytes(tx);
    auto check = execution_engine_.check_transaction(make_bytes_view(tx_bytes));
    if (check.code != 0) {
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
    const oracle::abci::RequestProcessProposal* request,
    oracle::abci::ResponseProcessProposal* response) {
  for (const auto& tx : request->txs()) {
    auto tx_bytes = make_bytes(tx);
    auto tx_result = execution_engine_.process_proposal_transaction(
        make_bytes_view(tx_bytes));
    if (tx_result.code != 0) {
      spdlog::warn("Rejecting proposal at height {}: {}", request->height(),
                   tx_result.log);
      response->set_status(
          oracle::abci::ResponseProcessProposal_ProposalStatus_REJECT);
      return finish_ok(context);
    }
  }
  response->set_status(
      oracle::abci::ResponseProcessProposal_ProposalStatus_ACCEPT);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::FinalizeBlock(
    grpc::CallbackServerContext* context,
    const oracle::abci::RequestFinalizeBlock* request,
    oracle::abci::ResponseFinalizeBlock* response) {
  auto txs = std::vector<oracle::schema::bytes_t>{};
  txs.reserve(request->txs_size());
  for (const auto& tx : request->txs()) {
    txs.push_back(make_bytes(tx));
  }

  auto execution = execution_engine_.finalize_block(
      static_cast<uint64_t>(request->height()), txs);
  for (const auto& tx_result : execution.tx_results) {
    populate_exec_tx_result(tx_result, response->add_tx_results());
  }
  response->set_app_hash(make_string(execution.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Commit(
    grpc::CallbackServerContext* context,
    const oracle::abci::RequestCommit* /*request*/,
    oracle::abci::ResponseCommit* response) {
  auto commit = execution_engine_.commit();
  response->set_retain_height(commit.retain_height);
  return finish_ok(context);
}
