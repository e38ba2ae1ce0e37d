#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <oracle/address/derive.hpp>
#include <oracle/blake3/hash.hpp>
#include <oracle/execution/engine.hpp>
#include <oracle/host/ed25519_program.hpp>
#include <oracle/program/attestation.hpp>
#include <oracle/schema/asset_record.hpp>
#include <oracle/schema/encoding/scale/encoder.hpp>
#include <oracle/schema/key/engine_keys.hpp>
#include <oracle/schema/query_error_code.hpp>
#include <iterator>
#include <tuple>
#include <utility>

using namespace oracle::schema;

namespace {

using encoder_t = oracle::schema::encoding::encoder<
    oracle::schema::encoding::scale_encoder_tag>;

oracle::schema::hash32_t fold_state_root(const oracle::schema::hash32_t& seed,
                                         const oracle::schema::bytes_t& tx,
                                         uint64_t height,
                                         uint64_t index) {
  auto material = oracle::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return oracle::blake3::hash(
      oracle::schema::bytes_view_t{material.data(), material.size()});
}

transaction_result_t make_error_result(error_code code,
                                       std::string_view codespace,
                                       std::string info) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = info.empty() ? std::string{describe(code)} : std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(query_result_t result,
                                query_error_code code,
                                std::string log) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{oracle::execution::kQueryCodespace};
  return result;
}

}  // namespace

namespace oracle::execution {

engine::engine(encoder_t& encoder,
               oracle::storage::storage<oracle::storage::rocksdb_storage_tag>&
                   storage,
               const program_id_t& program_id,
               oracle::program::uid_policy policy)
    : encoder_{encoder},
      storage_{storage},
      program_id_{program_id},
      processor_{encoder, policy} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing execution engine for program {} (uid policy {})",
               to_hex(program_id_), oracle::program::to_string(policy));
  load_persisted_state();
  spdlog::info("Execution engine ready at height {}", last_committed_height_);
}

const program_id_t& engine::program_id() const {
  return program_id_;
}

transaction_result_t engine::validate_transaction(
    const bytes_view_t& raw_tx,
    std::optional<transaction_t>& decoded) {
  if (raw_tx.empty()) {
    return make_error_result(error_code::invalid_transaction, kHostCodespace,
                             "empty transaction");
  }
  decoded = encoder_.try_decode_exact<transaction_t>(raw_tx);
  if (!decoded) {
    return make_error_result(error_code::invalid_transaction, kHostCodespace,
                             {});
  }
  if (decoded->version != 1) {
    return make_error_result(error_code::unsupported_transaction_version,
                             kHostCodespace, "expected version 1");
  }
  if (decoded->instructions.empty()) {
    return make_error_result(error_code::invalid_transaction, kHostCodespace,
                             "transaction has no instructions");
  }
  for (const auto& instruction : decoded->instructions) {
    if (instruction.program_id != program_id_ &&
        instruction.program_id != oracle::program::kEd25519ProgramId) {
      return make_error_result(error_code::unknown_program, kHostCodespace,
                               to_hex(instruction.program_id));
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decoded = std::optional<transaction_t>{};
  return validate_transaction(raw_tx, decoded);
}

transaction_result_t engine::process_proposal_transaction(
    const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decoded = std::optional<transaction_t>{};
  return validate_transaction(raw_tx, decoded);
}

std::optional<account_t> engine::load_committed_account(
    const address_t& address) {
  auto key = oracle::schema::key::make_account_key(encoder_, address);
  return storage_.get<encoder_t, account_t>(encoder_, make_bytes_view(key));
}

std::optional<account_t> engine::load_pending_account(
    const address_t& address) {
  if (auto it = pending_accounts_.find(address);
      it != std::end(pending_accounts_)) {
    return it->second;
  }
  return load_committed_account(address);
}

transaction_result_t engine::execute_transaction(const transaction_t& tx) {
  auto context = transaction_context{
      [this](const address_t& address) { return load_pending_account(address); },
      tx.instructions};

  for (auto index = std::size_t{0}; index < tx.instructions.size(); ++index) {
    const auto& instruction = tx.instructions[index];
    context.begin_instruction(index);

    if (instruction.program_id == oracle::program::kEd25519ProgramId) {
      if (auto error =
              oracle::host::execute_ed25519_instruction(tx.instructions, index)) {
        return make_error_result(*error, kHostCodespace,
                                 fmt::format("instruction {}: {}", index,
                                             describe(*error)));
      }
      continue;
    }
    if (instruction.program_id != program_id_) {
      return make_error_result(error_code::unknown_program, kHostCodespace,
                               fmt::format("instruction {}: {}", index,
                                           to_hex(instruction.program_id)));
    }
    if (auto error = processor_.process_instruction(context, instruction)) {
      return make_error_result(*error, kProgramCodespace,
                               fmt::format("instruction {}: {}", index,
                                           describe(*error)));
    }
  }

  for (const auto& [address, account] : context.writes()) {
    pending_accounts_[address] = account;
  }
  auto result = transaction_result_t{};
  result.info = fmt::format("{} instruction(s), {} account write(s)",
                            tx.instructions.size(), context.writes().size());
  return result;
}

block_result_t engine::finalize_block(uint64_t height,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  pending_accounts_.clear();

  auto rolling_root = last_committed_state_root_;
  for (std::size_t i = 0; i < txs.size(); ++i) {
    auto decoded = std::optional<transaction_t>{};
    auto tx_result = validate_transaction(make_bytes_view(txs[i]), decoded);
    if (tx_result.code == 0) {
      tx_result = execute_transaction(decoded.value());
    }
    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    } else {
      spdlog::debug("Transaction {} at height {} failed: {} ({})", i, height,
                    tx_result.log, tx_result.info);
    }
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

  auto entries = std::vector<oracle::storage::key_value_entry_t>{};
  entries.reserve(pending_accounts_.size());
  for (const auto& [address, account] : pending_accounts_) {
    entries.emplace_back(oracle::schema::key::make_account_key(encoder_, address),
                         encoder_.encode(account));
  }
  storage_.commit(entries,
                  oracle::storage::committed_state{
                      .height = last_committed_height_,
                      .state_root = last_committed_state_root_});
  spdlog::debug("Committed height {} with {} account write(s)",
                last_committed_height_, entries.size());
  pending_accounts_.clear();

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

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;

  auto account_data =
      [&](const address_t& address) -> std::optional<bytes_t> {
    auto account = load_committed_account(address);
    if (!account) {
      return std::nullopt;
    }
    return account->data;
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(
        std::tuple{last_committed_height_, last_committed_state_root_,
                   program_id_});
    return result;
  }

  if (path == "/account") {
    auto address = try_make_hash32(data);
    if (!address) {
      return make_query_error(std::move(result), query_error_code::invalid_key,
                              "expected 32-byte address");
    }
    auto account = load_committed_account(*address);
    if (!account) {
      return make_query_error(std::move(result), query_error_code::not_found,
                              "account not found");
    }
    result.value = encoder_.encode(*account);
    return result;
  }

  if (path == "/committee") {
    auto value = account_data(oracle::address::committee_address(program_id_));
    if (!value) {
      return make_query_error(std::move(result), query_error_code::not_found,
                              "committee not initialized");
    }
    result.value = std::move(*value);
    return result;
  }

  if (path == "/asset") {
    auto key = encoder_.try_decode_exact<asset_key_t>(data);
    if (!key) {
      return make_query_error(std::move(result), query_error_code::invalid_key,
                              "expected encoded asset key");
    }
    auto value = account_data(
        oracle::address::asset_address(encoder_, *key, program_id_));
    if (!value) {
      return make_query_error(std::move(result), query_error_code::not_found,
                              "asset not requested");
    }
    result.value = std::move(*value);
    return result;
  }

  if (path == "/assets") {
    auto prefix = oracle::schema::key::make_prefix_key(
        encoder_, oracle::schema::key::kAccountKeyPrefix);
    auto records = std::vector<std::tuple<address_t, bytes_t>>{};
    for (const auto& [raw_key, raw_value] :
         storage_.list_by_prefix(make_bytes_view(prefix))) {
      auto address = oracle::schema::key::parse_account_key(
          encoder_, make_bytes_view(raw_key));
      if (!address) {
        continue;
      }
      auto account =
          encoder_.try_decode_exact<account_t>(make_bytes_view(raw_value));
      if (!account || account->owner != program_id_ ||
          account->data.size() < kAssetNamespaceTag.size() ||
          !std::equal(std::begin(kAssetNamespaceTag),
                      std::end(kAssetNamespaceTag),
                      std::begin(account->data))) {
        continue;
      }
      records.emplace_back(*address, std::move(account->data));
    }
    result.value = encoder_.encode(records);
    result.info = fmt::format("{} asset record(s)", records.size());
    return result;
  }

  return make_query_error(std::move(result),
                          query_error_code::unsupported_path,
                          fmt::format("unsupported path '{}'", path));
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    pending_state_root_ = committed->state_root;
    return;
  }
  last_committed_state_root_ = make_zero_hash();
  pending_state_root_ = last_committed_state_root_;
  storage_.save_committed_state(oracle::storage::committed_state{
      .height = last_committed_height_,
      .state_root = last_committed_state_root_});
}

}  // namespace oracle::execution
