#include <cann/assembler/transaction_builder.hpp>
#include <cann/common/error.hpp>
#include <cann/schema/encoding/bch/encoder.hpp>
#include <cann/script/script.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <map>
#include <utility>

namespace cann::assembler {

namespace {

using encoder_t = cann::schema::encoding::encoder<
    cann::schema::encoding::bch_encoder_tag>;

using token_totals_t = std::map<cann::schema::hash32_t, uint64_t>;

void add_token_amount(token_totals_t& totals,
                      const std::optional<cann::schema::token_t>& token) {
  if (token && token->amount > 0) {
    totals[token->category] += token->amount;
  }
}

}  // namespace

transaction_builder::transaction_builder(const uint64_t fee_per_byte)
    : fee_per_byte_{fee_per_byte} {}

transaction_builder& transaction_builder::add_input(
    const cann::schema::utxo_t& utxo,
    cann::schema::bytes_t unlocking_bytecode,
    const uint32_t sequence) {
  draft_.inputs.push_back(
      cann::schema::input_t{.outpoint = utxo.outpoint,
                            .unlocking_bytecode = std::move(unlocking_bytecode),
                            .sequence = sequence});
  source_outputs_.push_back(cann::schema::make_source_output(utxo));
  return *this;
}

transaction_builder& transaction_builder::add_signer_input(
    const cann::schema::utxo_t& utxo) {
  signer_inputs_.push_back(draft_.inputs.size());
  return add_input(utxo, {});
}

transaction_builder& transaction_builder::add_output(
    cann::schema::output_t output) {
  draft_.outputs.push_back(std::move(output));
  return *this;
}

transaction_builder& transaction_builder::add_op_return_output(
    const std::string_view data) {
  return add_output(cann::schema::output_t{
      .locking_bytecode = cann::script::make_op_return_locking_bytecode(
          cann::schema::make_bytes_view(data)),
      .satoshis = 0});
}

transaction_builder& transaction_builder::set_change_output(
    cann::schema::locking_bytecode_t locking_bytecode,
    const cann::schema::satoshis_t available,
    const cann::schema::satoshis_t deductible) {
  change_ = change_t{.locking_bytecode = std::move(locking_bytecode),
                     .available = available,
                     .deductible = deductible};
  return *this;
}

void transaction_builder::verify_token_conservation() const {
  auto inputs = token_totals_t{};
  for (const auto& source : source_outputs_) {
    add_token_amount(inputs, source.token);
  }
  auto outputs = token_totals_t{};
  for (const auto& output : draft_.outputs) {
    add_token_amount(outputs, output.token);
  }
  if (inputs != outputs) {
    cann::common::throw_error(
        cann::common::error_code::invalid_argument,
        "transaction does not conserve fungible token amounts");
  }
}

transaction_template_t transaction_builder::build() const {
  verify_token_conservation();

  auto encoder = encoder_t{};
  auto result = transaction_template_t{.transaction = draft_,
                                       .source_outputs = source_outputs_,
                                       .signer_inputs = signer_inputs_};

  if (!change_) {
    result.encoded = encoder.encode(result.transaction);
    result.size = result.encoded.size();
    return result;
  }

  if (change_->available < change_->deductible) {
    cann::common::throw_error(
        cann::common::error_code::insufficient_funds,
        fmt::format("funding of {} sats does not cover {} sats",
                    change_->available, change_->deductible));
  }

  // Phase one: price the draft with a placeholder change value. The value
  // field has a fixed width so the final size is the measured size.
  result.transaction.outputs.push_back(cann::schema::output_t{
      .locking_bytecode = change_->locking_bytecode,
      .satoshis = change_->available - change_->deductible});
  auto draft = encoder.encode(result.transaction);
  result.size = draft.size();
  result.fee = static_cast<cann::schema::satoshis_t>(result.size) *
               fee_per_byte_;

  // Phase two: settle the change and freeze.
  if (change_->available < change_->deductible + result.fee) {
    cann::common::throw_error(
        cann::common::error_code::insufficient_funds,
        fmt::format("funding of {} sats does not cover {} sats plus a {} sat "
                    "fee",
                    change_->available, change_->deductible, result.fee));
  }
  result.transaction.outputs.back().satoshis =
      change_->available - change_->deductible - result.fee;
  result.encoded = encoder.encode(result.transaction);

  spdlog::debug("built transaction template: {} inputs, {} outputs, {} "
                "bytes, {} sat fee",
                result.transaction.inputs.size(),
                result.transaction.outputs.size(), result.size, result.fee);
  return result;
}

}  // namespace cann::assembler
