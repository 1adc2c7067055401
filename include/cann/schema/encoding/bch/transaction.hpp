#pragma once
#include <cann/schema/encoding/bch/stream.hpp>
#include <cann/schema/transaction.hpp>

namespace cann::schema::encoding::bch {

inline constexpr auto kTokenPrefix = uint8_t{0xef};
inline constexpr auto kTokenHasAmount = uint8_t{0x40};
inline constexpr auto kTokenHasNft = uint8_t{0x20};
inline constexpr auto kTokenHasCommitmentLength = uint8_t{0x10};
inline constexpr auto kTokenCapabilityMask = uint8_t{0x0f};
inline constexpr auto kTokenReservedBit = uint8_t{0x80};

void encode(const token_t& o, writer& out);
void encode(const output_t& o, writer& out);
void encode(const input_t& o, writer& out);
void encode(const transaction_t& o, writer& out);

void decode(token_t& o, reader& in);
void decode(output_t& o, reader& in);
void decode(input_t& o, reader& in);
void decode(transaction_t& o, reader& in);

}  // namespace cann::schema::encoding::bch
