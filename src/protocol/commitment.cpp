#include <cann/common/error.hpp>
#include <cann/protocol/commitment.hpp>
#include <cann/protocol/constants.hpp>
#include <cann/protocol/name.hpp>

#include <boost/endian/buffers.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace cann::protocol {

namespace {

std::optional<std::string> suffix_after(
    const cann::schema::bytes_view_t& commitment, const size_t offset) {
  if (commitment.size() <= offset) {
    return std::nullopt;
  }
  return cann::schema::make_string(commitment.subspan(offset));
}

}  // namespace

cann::schema::bytes_t encode_registration_id(
    const cann::schema::registration_id_t registration_id) {
  auto buffer = boost::endian::big_uint64_buf_t{registration_id};
  return cann::schema::bytes_t{buffer.data(), buffer.data() + sizeof(buffer)};
}

cann::schema::registration_id_t decode_registration_id(
    const cann::schema::bytes_view_t& commitment) {
  if (commitment.size() < kRegistrationIdSize) {
    cann::common::throw_error(
        cann::common::error_code::decode_failure,
        fmt::format("commitment of {} bytes is too short for a registration "
                    "id",
                    commitment.size()));
  }
  auto buffer = boost::endian::big_uint64_buf_t{};
  std::copy_n(std::begin(commitment), kRegistrationIdSize, buffer.data());
  return buffer.value();
}

cann::schema::bytes_t make_ownership_commitment(
    const cann::schema::registration_id_t registration_id,
    const std::string_view name) {
  auto out = encode_registration_id(registration_id);
  auto name_bytes = name_to_bytes(name);
  out.insert(std::end(out), std::begin(name_bytes), std::end(name_bytes));
  return out;
}

cann::schema::bytes_t make_auction_commitment(
    const cann::schema::hash20_t& bidder, const std::string_view name) {
  auto out = cann::schema::bytes_t{std::begin(bidder), std::end(bidder)};
  auto name_bytes = name_to_bytes(name);
  out.insert(std::end(out), std::begin(name_bytes), std::end(name_bytes));
  return out;
}

std::optional<std::string> name_from_ownership_commitment(
    const cann::schema::bytes_view_t& commitment) {
  return suffix_after(commitment, kRegistrationIdSize);
}

std::optional<std::string> name_from_auction_commitment(
    const cann::schema::bytes_view_t& commitment) {
  return suffix_after(commitment, kBidderHashSize);
}

std::optional<cann::schema::hash20_t> bidder_from_auction_commitment(
    const cann::schema::bytes_view_t& commitment) {
  if (commitment.size() < kBidderHashSize) {
    return std::nullopt;
  }
  auto bidder = cann::schema::hash20_t{};
  std::copy_n(std::begin(commitment), bidder.size(), std::begin(bidder));
  return bidder;
}

}  // namespace cann::protocol
