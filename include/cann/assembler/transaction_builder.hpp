#pragma once

#include <cann/schema/primitives.hpp>
#include <cann/schema/transaction.hpp>
#include <cann/schema/utxo.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace cann::assembler {

/// Unsigned transaction handed to the caller for signing.
struct transaction_template_t final {
  cann::schema::transaction_t transaction;
  // Output spent by each input, in input order.
  std::vector<cann::schema::output_t> source_outputs;
  // Inputs left with an empty unlocking bytecode for the wallet to sign.
  std::vector<size_t> signer_inputs;
  cann::schema::bytes_t encoded;
  size_t size{};
  cann::schema::satoshis_t fee{};
};

/// Two-phase transaction assembly.
///
/// Inputs and outputs are collected as a draft whose change output holds a
/// placeholder. `build()` serializes the draft, prices it at
/// `fee_per_byte`, writes the final change value and returns the frozen
/// template. The change output is always the last output.
class transaction_builder final {
 public:
  explicit transaction_builder(uint64_t fee_per_byte);

  transaction_builder& add_input(
      const cann::schema::utxo_t& utxo,
      cann::schema::bytes_t unlocking_bytecode,
      uint32_t sequence = cann::schema::kDefaultSequence);
  transaction_builder& add_signer_input(const cann::schema::utxo_t& utxo);
  transaction_builder& add_output(cann::schema::output_t output);
  transaction_builder& add_op_return_output(std::string_view data);

  /// Change output paying `available - deductible - fee`.
  transaction_builder& set_change_output(
      cann::schema::locking_bytecode_t locking_bytecode,
      cann::schema::satoshis_t available,
      cann::schema::satoshis_t deductible = 0);

  /// Throws cann::common::error (insufficient_funds) when the change cannot
  /// cover the fee, and (invalid_argument) when the draft does not conserve
  /// fungible token amounts per category.
  transaction_template_t build() const;

 private:
  struct change_t final {
    cann::schema::locking_bytecode_t locking_bytecode;
    cann::schema::satoshis_t available{};
    cann::schema::satoshis_t deductible{};
  };

  void verify_token_conservation() const;

  uint64_t fee_per_byte_;
  cann::schema::transaction_t draft_;
  std::vector<cann::schema::output_t> source_outputs_;
  std::vector<size_t> signer_inputs_;
  std::optional<change_t> change_;
};

}  // namespace cann::assembler
