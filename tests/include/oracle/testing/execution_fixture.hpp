#pragma once

#include <oracle/execution/engine.hpp>
#include <oracle/program/uid_policy.hpp>
#include <oracle/schema/primitives.hpp>
#include <oracle/storage/rocksdb/storage.hpp>
#include <oracle/testing/common.hpp>
#include <oracle/testing/harness.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace oracle::testing {

class execution_fixture final {
 public:
  explicit execution_fixture(
      const std::string_view db_prefix,
      const oracle::program::uid_policy policy =
          oracle::program::uid_policy::assign_and_increment)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{oracle::storage::make_storage<
            oracle::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_, make_program_id(), policy},
        builder_{encoder_, make_program_id()} {}

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() { remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }

  oracle::storage::storage<oracle::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }

  oracle::execution::engine& engine() { return engine_; }

  const instruction_builder& builder() const { return builder_; }

  /// FinalizeBlock followed by Commit for `txs` at `height`.
  oracle::schema::block_result_t apply_block(
      const uint64_t height,
      const std::vector<oracle::schema::bytes_t>& txs) {
    auto result = engine_.finalize_block(height, txs);
    engine_.commit();
    return result;
  }

  /// Single transaction block; returns the transaction result.
  oracle::schema::transaction_result_t apply(
      const uint64_t height,
      const std::vector<oracle::schema::instruction_t>& instructions) {
    auto result = apply_block(height, {encode_transaction(instructions)});
    return result.tx_results.at(0);
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  oracle::storage::storage<oracle::storage::rocksdb_storage_tag> storage_;
  oracle::execution::engine engine_;
  instruction_builder builder_;
};

}  // namespace oracle::testing
