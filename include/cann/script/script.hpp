#pragma once
#include <cann/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace cann::script {

inline constexpr auto kOpReturn = uint8_t{0x6a};
inline constexpr auto kOpPushData1 = uint8_t{0x4c};
inline constexpr auto kOpPushData2 = uint8_t{0x4d};
inline constexpr auto kOpPushData4 = uint8_t{0x4e};
inline constexpr auto kMaxDirectPush = uint8_t{0x4b};

// Smallest push opcode sequence carrying `data`.
cann::schema::bytes_t make_push(const cann::schema::bytes_view_t& data);

cann::schema::locking_bytecode_t make_p2pkh_locking_bytecode(
    const cann::schema::hash20_t& public_key_hash);
cann::schema::locking_bytecode_t make_p2sh32_locking_bytecode(
    const cann::schema::bytes_view_t& redeem_bytecode);
cann::schema::locking_bytecode_t make_op_return_locking_bytecode(
    const cann::schema::bytes_view_t& payload);

std::optional<cann::schema::hash20_t> try_extract_p2pkh_hash(
    const cann::schema::bytes_view_t& locking_bytecode);

// Payload of the first push following OP_RETURN. Returns std::nullopt for
// anything that is not a well formed data carrier.
std::optional<cann::schema::bytes_t> try_extract_op_return_payload(
    const cann::schema::bytes_view_t& locking_bytecode);

}  // namespace cann::script
