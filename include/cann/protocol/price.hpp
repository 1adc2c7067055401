#pragma once

#include <cann/schema/primitives.hpp>

#include <boost/multiprecision/cpp_int.hpp>

namespace cann::protocol {

// Intermediate products of the fixed-point price formulas exceed 64 bits.
using wide_amount_t = boost::multiprecision::uint256_t;

// (b * 1'000'000 - b * id * 3) / 1'000'000, floored at kMinimalAuctionPrice.
cann::schema::satoshis_t auction_price(
    cann::schema::registration_id_t registration_id,
    cann::schema::satoshis_t min_starting_bid);

// price * (100 + pct) / 100.
cann::schema::satoshis_t minimum_bid(cann::schema::satoshis_t price,
                                     uint64_t min_bid_increase_percentage);

// (price - kMinimalDeductionInNameClaim) * (100'000 - id) / 100'000. Ids
// above 100'000 are invalid_argument.
cann::schema::satoshis_t creator_incentive(
    cann::schema::satoshis_t auction_price,
    cann::schema::registration_id_t registration_id);

// auction * pct / 100, rounded down.
cann::schema::satoshis_t platform_fee(cann::schema::satoshis_t auction_price,
                                      uint64_t max_platform_fee_percentage);

}  // namespace cann::protocol
