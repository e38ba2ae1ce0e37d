#pragma once

#include <oracle/abci/application.grpc.pb.h>
#include <oracle/execution/engine.hpp>

namespace oracle::abci {

/// ABCI callback listener used by the consensus engine to drive the oracle.
///
/// Quick reference:
/// - Echo: liveness.
/// - Info: handshake, last committed height and state root.
/// - CheckTx: mempool admission checks; no state mutation.
/// - PrepareProposal: proposer-side tx selection/filtering.
/// - ProcessProposal: validator-side proposal accept/reject decision.
/// - FinalizeBlock: execute block and return tx results + app_hash(state_root).
/// - Commit: persist finalized state.
/// - Query: read committed accounts and records.
struct listener final : public oracle::abci::Application::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(oracle::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Echo(
      grpc::CallbackServerContext* context,
      const oracle::abci::RequestEcho* request,
      oracle::abci::ResponseEcho* response) override final;

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const oracle::abci::RequestInfo* request,
      oracle::abci::ResponseInfo* response) override final;

  /// Mempool admission check for a single tx (decode/validate only).
  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const oracle::abci::RequestCheckTx* request,
      oracle::abci::ResponseCheckTx* response) override final;

  /// Execute read query against current committed state.
  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const oracle::abci::RequestQuery* request,
      oracle::abci::ResponseQuery* response) override final;

  /// Proposer-side tx list preparation under max-bytes and validity checks.
  virtual grpc::ServerUnaryReactor* PrepareProposal(
      grpc::CallbackServerContext* context,
      const oracle::abci::RequestPrepareProposal* request,
      oracle::abci::ResponsePrepareProposal* response) override final;

  /// Validator-side proposal validation; returns ACCEPT or REJECT.
  virtual grpc::ServerUnaryReactor* ProcessProposal(
      grpc::CallbackServerContext* context,
      const oracle::abci::RequestProcessProposal* request,
      oracle::abci::ResponseProcessProposal* response) override final;

  /// Execute ordered block transactions and return tx results + app_hash.
  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const oracle::abci::RequestFinalizeBlock* request,
      oracle::abci::ResponseFinalizeBlock* response) override final;

  /// Persist finalized state after FinalizeBlock.
  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const oracle::abci::RequestCommit* request,
      oracle::abci::ResponseCommit* response) override final;

  oracle::execution::engine& execution_engine_;
};

}  // namespace oracle::abci
