#include <cann/assembler/assembler.hpp>
#include <cann/common/error.hpp>
#include <cann/protocol/commitment.hpp>
#include <cann/protocol/records.hpp>
#include <cann/resolver/record_resolver.hpp>
#include <cann/script/script.hpp>
#include <cann/testing/registry_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

class record_resolver_test : public ::testing::Test {
 protected:
  void SetUp() override {
    fixture_.add_domain_tokens("test", 5, 50);
    fixture_.transport().add_utxos(
        {cann::testing::make_utxo(
             60, 1000, owner_,
             cann::testing::make_token(
                 0, cann::schema::token_capability_t::none,
                 cann::protocol::make_ownership_commitment(5, "test"))),
         cann::testing::make_utxo(61, 50'000, owner_)});
  }

  void publish(const std::vector<std::string>& records, const int64_t height) {
    auto assembler = cann::assembler::assembler{
        fixture_.config(), fixture_.covenants(), fixture_.transport()};
    auto result = assembler.build_records_transaction(
        {.name = "test", .records = records, .owner = owner_});
    fixture_.transport().add_transaction(result.transaction, height);
  }

  cann::resolver::record_resolver make_resolver() {
    return cann::resolver::record_resolver{
        fixture_.config(), fixture_.covenants(), fixture_.transport()};
  }

  cann::testing::registry_fixture fixture_{};
  cann::schema::locking_bytecode_t owner_{cann::testing::make_p2pkh(0x70)};
};

}  // namespace

TEST_F(record_resolver_test, records_accumulate_across_transactions) {
  publish({"a=1", "social.twitter=@cann"}, 100);
  publish({"b=2", "a=1"}, 101);

  auto records = make_resolver().fetch_records("test");
  EXPECT_EQ(records,
            (std::vector<std::string>{"a=1", "social.twitter=@cann", "b=2"}));
}

TEST_F(record_resolver_test, later_revocation_removes_a_record) {
  publish({"a=1", "b=2"}, 100);
  publish({cann::protocol::make_revocation_record("a=1")}, 101);

  EXPECT_EQ(make_resolver().fetch_records("test"),
            (std::vector<std::string>{"b=2"}));
}

TEST_F(record_resolver_test, data_without_domain_token_is_ignored) {
  publish({"a=1"}, 100);
  auto spam = cann::schema::transaction_t{
      .inputs = {cann::schema::input_t{
          .outpoint = {.txid = cann::testing::make_hash(0x99), .index = 0}}},
      .outputs = {
          cann::schema::output_t{
              .locking_bytecode = fixture_.covenants().domain("test").locking_bytecode,
              .satoshis = 1000},
          cann::schema::output_t{
              .locking_bytecode =
                  cann::script::make_op_return_locking_bytecode(
                      cann::protocol::name_to_bytes("a=spoofed"))}}};
  fixture_.transport().add_transaction(spam, 101);

  EXPECT_EQ(make_resolver().fetch_records("test"),
            (std::vector<std::string>{"a=1"}));
}

TEST_F(record_resolver_test, get_records_builds_the_key_tree) {
  publish({"social.Twitter=@cann", "addr.meta=type:array", "addr.0=x",
           "addr.1=y"},
          100);

  auto records = make_resolver().get_records("test");
  EXPECT_EQ(records.records.size(), 4u);
  const auto* twitter = records.tree.find("social.twitter");
  ASSERT_NE(twitter, nullptr);
  EXPECT_EQ(twitter->value, "@cann");
  const auto* addr = records.tree.find("addr");
  ASSERT_NE(addr, nullptr);
  EXPECT_EQ(addr->items, (std::vector<std::string>{"x", "y"}));
}

TEST_F(record_resolver_test, unpublished_domain_has_no_records) {
  EXPECT_TRUE(make_resolver().fetch_records("other").empty());
}

TEST_F(record_resolver_test, invalid_name_is_rejected) {
  try {
    static_cast<void>(make_resolver().fetch_records("Bad Name"));
    ADD_FAILURE() << "expected invalid_name";
  } catch (const cann::common::error& e) {
    EXPECT_EQ(e.code(), cann::common::error_code::invalid_name);
  }
}
