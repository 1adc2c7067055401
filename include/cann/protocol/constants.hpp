#pragma once

#include <cann/schema/primitives.hpp>

namespace cann::protocol {

// Satoshis reserved from the winning bid for the claim outputs and fee.
inline constexpr auto kMinimalDeductionInNameClaim =
    cann::schema::satoshis_t{6500};
// Satoshis the auction opener must hold on top of the bid.
inline constexpr auto kMinimalDeductionInAuction =
    cann::schema::satoshis_t{3500};
inline constexpr auto kMinimalCreatorIncentive = cann::schema::satoshis_t{1000};
inline constexpr auto kMinimalAuctionPrice = cann::schema::satoshis_t{6000};

// Value carried by each token output minted when a name is claimed.
inline constexpr auto kDomainTokenSatoshis = cann::schema::satoshis_t{1000};

inline constexpr auto kRegistrationIdSize = size_t{8};
inline constexpr auto kBidderHashSize = size_t{20};

inline constexpr auto kPriceScale = uint64_t{1'000'000};
inline constexpr auto kPriceDecayPerRegistration = uint64_t{3};
inline constexpr auto kIncentiveScale = uint64_t{100'000};

}  // namespace cann::protocol
