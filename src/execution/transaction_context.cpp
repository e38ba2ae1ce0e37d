#include <oracle/execution/transaction_context.hpp>

#include <utility>

using namespace oracle::schema;

namespace oracle::execution {

transaction_context::transaction_context(
    account_loader_t base,
    const std::vector<instruction_t>& instructions)
    : base_{std::move(base)}, instructions_{instructions} {}

void transaction_context::begin_instruction(std::size_t index) {
  current_ = index;
}

const program_id_t& transaction_context::program_id() const {
  return instructions_[current_].program_id;
}

std::optional<account_t> transaction_context::load_account(
    const address_t& address) const {
  if (auto it = writes_.find(address); it != std::end(writes_)) {
    return it->second;
  }
  return base_(address);
}

program_result_t transaction_context::create_account(const address_t& address,
                                                     bytes_t data) {
  if (load_account(address)) {
    return error_code::account_already_exists;
  }
  writes_[address] = account_t{.owner = program_id(), .data = std::move(data)};
  return std::nullopt;
}

program_result_t transaction_context::write_account(const address_t& address,
                                                    bytes_t data) {
  auto existing = load_account(address);
  if (!existing || existing->owner != program_id()) {
    return error_code::not_owned_by_program;
  }
  existing->data = std::move(data);
  writes_[address] = std::move(existing.value());
  return std::nullopt;
}

const instruction_t* transaction_context::companion_instruction() const {
  if (current_ == 0) {
    return nullptr;
  }
  return &instructions_[current_ - 1];
}

const account_map_t& transaction_context::writes() const {
  return writes_;
}

}  // namespace oracle::execution
