#pragma once

#include <cann/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

// Byte layouts of the non-fungible commitments the protocol writes.
//
//   registration counter / internal auth : id (8 bytes, big endian)
//   ownership token                      : id (8 bytes, big endian) + name
//   auction token                        : bidder pkh (20 bytes) + name
namespace cann::protocol {

cann::schema::bytes_t encode_registration_id(
    cann::schema::registration_id_t registration_id);

// Reads the leading 8-byte big-endian id. Throws cann::common::error
// (decode_failure) for shorter commitments.
cann::schema::registration_id_t decode_registration_id(
    const cann::schema::bytes_view_t& commitment);

cann::schema::bytes_t make_ownership_commitment(
    cann::schema::registration_id_t registration_id,
    std::string_view name);
cann::schema::bytes_t make_auction_commitment(
    const cann::schema::hash20_t& bidder, std::string_view name);

std::optional<std::string> name_from_ownership_commitment(
    const cann::schema::bytes_view_t& commitment);
std::optional<std::string> name_from_auction_commitment(
    const cann::schema::bytes_view_t& commitment);
std::optional<cann::schema::hash20_t> bidder_from_auction_commitment(
    const cann::schema::bytes_view_t& commitment);

}  // namespace cann::protocol
