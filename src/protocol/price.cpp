#include <cann/common/error.hpp>
#include <cann/protocol/constants.hpp>
#include <cann/protocol/price.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <limits>

namespace cann::protocol {

namespace {

cann::schema::satoshis_t narrow(const wide_amount_t& value,
                                const std::string_view what) {
  if (value > std::numeric_limits<cann::schema::satoshis_t>::max()) {
    cann::common::throw_error(cann::common::error_code::invalid_argument,
                              fmt::format("{} overflows 64 bits", what));
  }
  return static_cast<cann::schema::satoshis_t>(value);
}

}  // namespace

cann::schema::satoshis_t auction_price(
    const cann::schema::registration_id_t registration_id,
    const cann::schema::satoshis_t min_starting_bid) {
  auto starting = wide_amount_t{min_starting_bid} * kPriceScale;
  auto decay = wide_amount_t{min_starting_bid} * registration_id *
               kPriceDecayPerRegistration;
  if (decay >= starting) {
    return kMinimalAuctionPrice;
  }
  auto price = narrow((starting - decay) / kPriceScale, "auction price");
  return std::max(price, kMinimalAuctionPrice);
}

cann::schema::satoshis_t minimum_bid(
    const cann::schema::satoshis_t price,
    const uint64_t min_bid_increase_percentage) {
  auto scaled = wide_amount_t{price} *
                (wide_amount_t{100} + min_bid_increase_percentage) / 100;
  return narrow(scaled, "minimum bid");
}

cann::schema::satoshis_t creator_incentive(
    const cann::schema::satoshis_t auction_price,
    const cann::schema::registration_id_t registration_id) {
  if (registration_id > kIncentiveScale) {
    cann::common::throw_error(
        cann::common::error_code::invalid_argument,
        fmt::format("registration id {} is outside [0, {}]", registration_id,
                    kIncentiveScale));
  }
  if (auction_price <= kMinimalDeductionInNameClaim) {
    return 0;
  }
  auto incentive = wide_amount_t{auction_price - kMinimalDeductionInNameClaim} *
                   (kIncentiveScale - registration_id) / kIncentiveScale;
  return narrow(incentive, "creator incentive");
}

cann::schema::satoshis_t platform_fee(
    const cann::schema::satoshis_t auction_price,
    const uint64_t max_platform_fee_percentage) {
  auto fee = wide_amount_t{auction_price} * max_platform_fee_percentage / 100;
  return narrow(fee, "platform fee");
}

}  // namespace cann::protocol
