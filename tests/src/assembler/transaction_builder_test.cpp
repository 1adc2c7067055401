#include <cann/assembler/transaction_builder.hpp>
#include <cann/common/error.hpp>
#include <cann/schema/encoding/bch/encoder.hpp>
#include <cann/testing/common.hpp>
#include <gtest/gtest.h>

namespace {

using cann::schema::token_capability_t;
using encoder_t =
    cann::schema::encoding::encoder<cann::schema::encoding::bch_encoder_tag>;

}  // namespace

TEST(transaction_builder, change_pays_available_minus_deductible_and_fee) {
  auto payer = cann::testing::make_p2pkh(1);
  auto funding = cann::testing::make_utxo(1, 50'000, payer);

  auto result = cann::assembler::transaction_builder{2}
                    .add_signer_input(funding)
                    .add_output(cann::schema::output_t{
                        .locking_bytecode = cann::testing::make_p2pkh(2),
                        .satoshis = 10'000})
                    .set_change_output(payer, funding.satoshis, 10'000)
                    .build();

  EXPECT_EQ(result.size, result.encoded.size());
  EXPECT_EQ(result.fee, result.size * 2);
  ASSERT_EQ(result.transaction.outputs.size(), 2u);
  EXPECT_EQ(result.transaction.outputs.back().locking_bytecode, payer);
  EXPECT_EQ(result.transaction.outputs.back().satoshis,
            50'000u - 10'000u - result.fee);
  EXPECT_EQ(result.signer_inputs, (std::vector<size_t>{0}));
  EXPECT_TRUE(result.transaction.inputs[0].unlocking_bytecode.empty());
  ASSERT_EQ(result.source_outputs.size(), 1u);
  EXPECT_EQ(result.source_outputs[0].satoshis, 50'000u);
}

TEST(transaction_builder, encoded_bytes_match_the_frozen_transaction) {
  auto payer = cann::testing::make_p2pkh(1);
  auto result =
      cann::assembler::transaction_builder{1}
          .add_signer_input(cann::testing::make_utxo(1, 10'000, payer))
          .add_op_return_output("key=value")
          .set_change_output(payer, 10'000)
          .build();
  EXPECT_EQ(encoder_t{}.encode(result.transaction), result.encoded);
  EXPECT_EQ(result.transaction.outputs[0].satoshis, 0u);
}

TEST(transaction_builder, covenant_inputs_keep_unlocking_and_sequence) {
  auto covenant = cann::testing::make_p2pkh(3);
  auto payer = cann::testing::make_p2pkh(1);
  auto result =
      cann::assembler::transaction_builder{1}
          .add_input(cann::testing::make_utxo(3, 1000, covenant), {0x51, 0x52},
                     4)
          .add_signer_input(cann::testing::make_utxo(1, 10'000, payer))
          .add_output(cann::schema::output_t{.locking_bytecode = covenant,
                                             .satoshis = 1000})
          .set_change_output(payer, 10'000)
          .build();
  EXPECT_EQ(result.transaction.inputs[0].unlocking_bytecode,
            (cann::schema::bytes_t{0x51, 0x52}));
  EXPECT_EQ(result.transaction.inputs[0].sequence, 4u);
  EXPECT_EQ(result.transaction.inputs[1].sequence,
            cann::schema::kDefaultSequence);
  EXPECT_EQ(result.signer_inputs, (std::vector<size_t>{1}));
}

TEST(transaction_builder, funding_short_of_fee_is_insufficient_funds) {
  auto payer = cann::testing::make_p2pkh(1);
  auto builder = cann::assembler::transaction_builder{2};
  builder.add_signer_input(cann::testing::make_utxo(1, 10'050, payer))
      .set_change_output(payer, 10'050, 10'000);
  try {
    static_cast<void>(builder.build());
    FAIL() << "expected insufficient_funds";
  } catch (const cann::common::error& e) {
    EXPECT_EQ(e.code(), cann::common::error_code::insufficient_funds);
  }

  auto short_builder = cann::assembler::transaction_builder{2};
  short_builder.set_change_output(payer, 100, 200);
  EXPECT_THROW(static_cast<void>(short_builder.build()), cann::common::error);
}

TEST(transaction_builder, fungible_amounts_must_be_conserved) {
  auto holder = cann::testing::make_p2pkh(5);
  auto token_utxo = cann::testing::make_utxo(
      5, 1000, holder,
      cann::testing::make_token(100, token_capability_t::minting, {0x01}));
  auto output = cann::schema::make_source_output(token_utxo);

  output.token->amount = 99;
  auto leaking = cann::assembler::transaction_builder{1};
  leaking.add_input(token_utxo, {}).add_output(output);
  try {
    static_cast<void>(leaking.build());
    FAIL() << "expected invalid_argument";
  } catch (const cann::common::error& e) {
    EXPECT_EQ(e.code(), cann::common::error_code::invalid_argument);
  }

  auto split_a = cann::schema::make_source_output(token_utxo);
  split_a.token->amount = 60;
  auto split_b = split_a;
  split_b.token->amount = 40;
  auto conserving = cann::assembler::transaction_builder{1};
  conserving.add_input(token_utxo, {}).add_output(split_a).add_output(split_b);
  EXPECT_NO_THROW(static_cast<void>(conserving.build()));
}

TEST(transaction_builder, template_without_change_has_no_fee) {
  auto holder = cann::testing::make_p2pkh(5);
  auto utxo = cann::testing::make_utxo(5, 1000, holder);
  auto result = cann::assembler::transaction_builder{1}
                    .add_input(utxo, {})
                    .add_output(cann::schema::make_source_output(utxo))
                    .build();
  EXPECT_EQ(result.fee, 0u);
  EXPECT_EQ(result.size, result.encoded.size());
}
