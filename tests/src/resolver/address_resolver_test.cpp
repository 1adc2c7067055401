#include <cann/common/error.hpp>
#include <cann/protocol/commitment.hpp>
#include <cann/resolver/address_resolver.hpp>
#include <cann/testing/fake_indexer.hpp>
#include <cann/testing/registry_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using cann::resolver::resolution_strategy_t;
using cann::schema::token_capability_t;

namespace {

constexpr auto kIndexerUrl = "https://index.example/v1/graphql";

cann::schema::transaction_t make_spend(const uint8_t seed,
                                       std::vector<cann::schema::output_t> outputs) {
  return cann::schema::transaction_t{
      .inputs = {cann::schema::input_t{
          .outpoint = {.txid = cann::testing::make_hash(seed), .index = 0}}},
      .outputs = std::move(outputs)};
}

// Name "test" claimed with registration id 5 and its ownership token sent to
// alice at height 100.
class address_resolver_test : public ::testing::Test {
 protected:
  void SetUp() override {
    fixture_.add_domain_tokens("test", 5, 50);
    auto claim = make_spend(
        0x80, {cann::schema::output_t{
                   .locking_bytecode = domain(),
                   .satoshis = 1000,
                   .token = cann::testing::make_token(
                       0, token_capability_t::none,
                       cann::protocol::encode_registration_id(5))},
               ownership_output(alice_)});
    claim_txid_ = fixture_.transport().add_transaction(claim, 100);
    fixture_.transport().add_utxo(ownership_utxo(0x81, alice_));
    indexer_.add_output(fixture_.config().category, commitment_,
                        {.txid = claim_txid_,
                         .index = 1,
                         .locking_bytecode = alice_,
                         .height = 100});
  }

  cann::schema::locking_bytecode_t domain() {
    return fixture_.covenants().domain("test").locking_bytecode;
  }

  cann::schema::output_t ownership_output(
      const cann::schema::locking_bytecode_t& owner) {
    return cann::schema::output_t{
        .locking_bytecode = owner,
        .satoshis = 1000,
        .token = cann::testing::make_token(0, token_capability_t::none,
                                           commitment_)};
  }

  cann::schema::utxo_t ownership_utxo(const uint8_t seed,
                                      const cann::schema::locking_bytecode_t& owner) {
    return cann::testing::make_utxo(
        seed, 1000, owner,
        cann::testing::make_token(0, token_capability_t::none, commitment_));
  }

  // Moves the token from `from` to `to` at `height`; a mempool transfer has
  // height 0 and no indexer height.
  void transfer(const uint8_t seed, const cann::schema::locking_bytecode_t& from,
                const cann::schema::locking_bytecode_t& to,
                const int64_t height) {
    auto txid = fixture_.transport().add_transaction(
        make_spend(seed, {ownership_output(to)}), height, {from});
    fixture_.transport().remove_utxos(from);
    fixture_.transport().add_utxo(ownership_utxo(seed, to));
    indexer_.add_output(
        fixture_.config().category, commitment_,
        {.txid = txid,
         .index = 0,
         .locking_bytecode = to,
         .height = height > 0
                       ? std::optional<uint64_t>{static_cast<uint64_t>(height)}
                       : std::nullopt});
  }

  // The configured indexer URL follows whether an indexer is attached.
  cann::resolver::address_resolver make_resolver(const bool with_indexer) {
    fixture_.config().indexer_url =
        with_indexer ? std::optional<std::string>{kIndexerUrl} : std::nullopt;
    return cann::resolver::address_resolver{
        fixture_.config(), fixture_.covenants(), fixture_.transport(),
        with_indexer ? &indexer_ : nullptr};
  }

  void expect_owner(const std::optional<cann::schema::locking_bytecode_t>& owner) {
    EXPECT_EQ(make_resolver(false).resolve_name("test"), owner);
    EXPECT_EQ(make_resolver(true).resolve_name("test"), owner);
    EXPECT_EQ(make_resolver(true).resolve_name("test",
                                               resolution_strategy_t::history),
              owner);
  }

  cann::testing::registry_fixture fixture_{};
  cann::testing::fake_indexer indexer_{};
  cann::schema::bytes_t commitment_{
      cann::protocol::make_ownership_commitment(5, "test")};
  cann::schema::hash32_t claim_txid_{};
  cann::schema::locking_bytecode_t alice_{cann::testing::make_p2pkh(0xa1)};
  cann::schema::locking_bytecode_t bob_{cann::testing::make_p2pkh(0xb0)};
  cann::schema::locking_bytecode_t carol_{cann::testing::make_p2pkh(0xc0)};
};

}  // namespace

TEST_F(address_resolver_test, claimant_owns_an_untransferred_name) {
  expect_owner(alice_);
}

TEST_F(address_resolver_test, transfers_are_followed) {
  transfer(0x90, alice_, bob_, 110);
  transfer(0x91, bob_, carol_, 120);
  expect_owner(carol_);
}

TEST_F(address_resolver_test, mempool_transfer_wins) {
  transfer(0x90, alice_, bob_, 110);
  transfer(0x91, bob_, carol_, 0);
  expect_owner(carol_);
}

TEST_F(address_resolver_test, burned_token_resolves_to_nothing) {
  transfer(0x90, alice_, bob_, 110);
  fixture_.transport().add_transaction(
      make_spend(0x92, {cann::schema::output_t{.locking_bytecode = carol_,
                                               .satoshis = 900}}),
      130, {bob_});
  fixture_.transport().remove_utxos(bob_);
  expect_owner(std::nullopt);
}

TEST_F(address_resolver_test, unregistered_name_resolves_to_nothing) {
  EXPECT_FALSE(make_resolver(false).resolve_name("other").has_value());
  EXPECT_FALSE(make_resolver(true).resolve_name("other").has_value());
}

TEST_F(address_resolver_test, indexer_strategy_requires_an_indexer) {
  try {
    static_cast<void>(
        make_resolver(false).resolve_name("test", resolution_strategy_t::indexer));
    ADD_FAILURE() << "expected configuration_error";
  } catch (const cann::common::error& e) {
    EXPECT_EQ(e.code(), cann::common::error_code::configuration_error);
  }
}

TEST_F(address_resolver_test, configured_indexer_url_selects_the_indexer) {
  auto empty_indexer = cann::testing::fake_indexer{};
  auto resolver = cann::resolver::address_resolver{
      fixture_.config(), fixture_.covenants(), fixture_.transport(),
      &empty_indexer};

  fixture_.config().indexer_url.reset();
  EXPECT_EQ(resolver.resolve_name("test"), alice_);

  fixture_.config().indexer_url = kIndexerUrl;
  EXPECT_FALSE(resolver.resolve_name("test").has_value());
  EXPECT_EQ(resolver.resolve_name("test", resolution_strategy_t::history),
            alice_);
}

TEST_F(address_resolver_test, configured_indexer_url_needs_an_indexer) {
  auto resolver = make_resolver(false);
  fixture_.config().indexer_url = kIndexerUrl;
  try {
    static_cast<void>(resolver.resolve_name("test"));
    ADD_FAILURE() << "expected configuration_error";
  } catch (const cann::common::error& e) {
    EXPECT_EQ(e.code(), cann::common::error_code::configuration_error);
  }
}

TEST_F(address_resolver_test, invalid_name_is_rejected) {
  try {
    static_cast<void>(make_resolver(true).resolve_name("a b"));
    ADD_FAILURE() << "expected invalid_name";
  } catch (const cann::common::error& e) {
    EXPECT_EQ(e.code(), cann::common::error_code::invalid_name);
  }
}

TEST_F(address_resolver_test, lookup_lists_owned_names_once) {
  fixture_.transport().add_utxos(
      {ownership_utxo(0x82, alice_),
       cann::testing::make_utxo(
           0x83, 1000, alice_,
           cann::testing::make_token(
               0, token_capability_t::none,
               cann::protocol::make_ownership_commitment(9, "other"))),
       // Internal authorization layout: id only, no name.
       cann::testing::make_utxo(
           0x84, 1000, alice_,
           cann::testing::make_token(0, token_capability_t::none,
                                     cann::protocol::encode_registration_id(7))),
       cann::testing::make_utxo(
           0x85, 1000, alice_,
           cann::testing::make_token(
               0, token_capability_t::none,
               cann::protocol::make_ownership_commitment(3, "foreign"),
               cann::testing::make_hash(0x01))),
       cann::testing::make_utxo(0x86, 5000, alice_)});

  EXPECT_EQ(make_resolver(false).lookup_address(alice_),
            (std::vector<std::string>{"test", "other"}));
  EXPECT_TRUE(make_resolver(false).lookup_address(bob_).empty());
}
