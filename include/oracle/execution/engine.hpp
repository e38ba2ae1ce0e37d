#pragma once

#include <oracle/execution/transaction_context.hpp>
#include <oracle/program/processor.hpp>
#include <oracle/program/uid_policy.hpp>
#include <oracle/schema/app_info.hpp>
#include <oracle/schema/block_result.hpp>
#include <oracle/schema/commit_result.hpp>
#include <oracle/schema/encoding/encoder.hpp>
#include <oracle/schema/error_code.hpp>
#include <oracle/schema/primitives.hpp>
#include <oracle/schema/query_result.hpp>
#include <oracle/schema/transaction.hpp>
#include <oracle/schema/transaction_result.hpp>
#include <oracle/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oracle::execution {

inline constexpr auto kHostCodespace = std::string_view{"oracle.host"};
inline constexpr auto kProgramCodespace = std::string_view{"oracle.program"};
inline constexpr auto kQueryCodespace = std::string_view{"oracle.query"};

/// Host ledger driving the oracle program for the ABCI server.
///
/// Transactions are ordered instruction lists executed atomically: the
/// native ed25519 facility and the oracle program run against a private
/// account overlay that is merged into the block state only when every
/// instruction succeeds. Committed accounts live in RocksDB.
class engine final {
 public:
  /// Construct the engine with encoder/storage backends and the id under
  /// which the oracle program is deployed.
  explicit engine(
      oracle::schema::encoding::encoder<
          oracle::schema::encoding::scale_encoder_tag>& encoder,
      oracle::storage::storage<oracle::storage::rocksdb_storage_tag>& storage,
      const oracle::schema::program_id_t& program_id,
      oracle::program::uid_policy policy =
          oracle::program::uid_policy::assign_and_increment);

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Performs decode + envelope checks only; does not touch account state.
  oracle::schema::transaction_result_t check_transaction(
      const oracle::schema::bytes_view_t& raw_tx);

  /// Validate a transaction in proposal flow. Same checks as CheckTx.
  oracle::schema::transaction_result_t process_proposal_transaction(
      const oracle::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block and compute its resulting state_root.
  ///
  /// Transactions are processed in-order; per-tx results are returned even on
  /// failures.
  oracle::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<oracle::schema::bytes_t>& txs);

  /// Write the finalized block's accounts and checkpoint in one batch.
  oracle::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  oracle::schema::app_info_t info() const;

  /// Read-path query against committed state.
  ///
  /// Paths: /engine/info, /account, /committee, /asset, /assets.
  oracle::schema::query_result_t query(
      std::string_view path,
      const oracle::schema::bytes_view_t& data);

  const oracle::schema::program_id_t& program_id() const;

 private:
  oracle::schema::transaction_result_t validate_transaction(
      const oracle::schema::bytes_view_t& raw_tx,
      std::optional<oracle::schema::transaction_t>& decoded);

  oracle::schema::transaction_result_t execute_transaction(
      const oracle::schema::transaction_t& tx);

  std::optional<oracle::schema::account_t> load_pending_account(
      const oracle::schema::address_t& address);

  std::optional<oracle::schema::account_t> load_committed_account(
      const oracle::schema::address_t& address);

  void load_persisted_state();

  mutable std::mutex mutex_;
  oracle::schema::encoding::encoder<
      oracle::schema::encoding::scale_encoder_tag>& encoder_;
  oracle::storage::storage<oracle::storage::rocksdb_storage_tag>& storage_;
  oracle::schema::program_id_t program_id_;
  oracle::program::processor processor_;
  int64_t last_committed_height_{};
  oracle::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  oracle::schema::hash32_t pending_state_root_{};
  account_map_t pending_accounts_;
};

}  // namespace oracle::execution
