#pragma once

#include <cann/config.hpp>
#include <cann/protocol/commitment.hpp>
#include <cann/schema/primitives.hpp>
#include <cann/schema/utxo.hpp>
#include <cann/script/script.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace cann::testing {

inline cann::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = cann::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline cann::schema::hash20_t make_pkh(const uint8_t seed) {
  auto out = cann::schema::hash20_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed ^ static_cast<uint8_t>(i));
  }
  return out;
}

inline cann::schema::locking_bytecode_t make_p2pkh(const uint8_t seed) {
  return cann::script::make_p2pkh_locking_bytecode(make_pkh(seed));
}

inline cann::schema::hash32_t make_category() { return make_hash(0xca); }

inline cann::schema::token_t make_token(
    const cann::schema::token_amount_t amount,
    const cann::schema::token_capability_t capability,
    cann::schema::bytes_t commitment,
    const cann::schema::hash32_t& category = make_category()) {
  return cann::schema::token_t{
      .category = category,
      .amount = amount,
      .nft = cann::schema::nft_t{.capability = capability,
                                 .commitment = std::move(commitment)}};
}

inline cann::schema::utxo_t make_utxo(
    const uint8_t seed,
    const cann::schema::satoshis_t satoshis,
    const cann::schema::locking_bytecode_t& locking_bytecode,
    std::optional<cann::schema::token_t> token = std::nullopt) {
  return cann::schema::utxo_t{
      .outpoint = cann::schema::outpoint_t{.txid = make_hash(seed),
                                           .index = seed},
      .satoshis = satoshis,
      .token = std::move(token),
      .locking_bytecode = locking_bytecode,
      .height = 100};
}

inline cann::config_t make_config() {
  return cann::config_t{.category = make_category(),
                        .min_starting_bid = 10'000,
                        .min_bid_increase_percentage = 5,
                        .inactivity_expiry_time = 4'194'303,
                        .min_wait_time = 1,
                        .max_platform_fee_percentage = 5,
                        .creator_incentive_address = make_p2pkh(0xcc),
                        .platform_fee_address = std::nullopt,
                        .tld = ".bch",
                        .indexer_url = std::nullopt,
                        .fee_per_byte = 1};
}

}  // namespace cann::testing
