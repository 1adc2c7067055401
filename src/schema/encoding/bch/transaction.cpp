#include <cann/common/error.hpp>
#include <cann/schema/encoding/bch/transaction.hpp>

#include <fmt/format.h>

#include <utility>

namespace cann::schema::encoding::bch {

namespace {

[[noreturn]] void fail(const std::string& message) {
  cann::common::throw_error(cann::common::error_code::decode_failure, message);
}

}  // namespace

void encode(const token_t& o, writer& out) {
  out.write_u8(kTokenPrefix);
  out.write_hash(o.category);

  auto bitfield = uint8_t{0};
  if (o.amount > 0) {
    bitfield |= kTokenHasAmount;
  }
  if (o.nft) {
    bitfield |= kTokenHasNft;
    bitfield |= static_cast<uint8_t>(o.nft->capability);
    if (!o.nft->commitment.empty()) {
      bitfield |= kTokenHasCommitmentLength;
    }
  }
  out.write_u8(bitfield);

  if (o.nft && !o.nft->commitment.empty()) {
    out.write_var_bytes(o.nft->commitment);
  }
  if (o.amount > 0) {
    out.write_compact_size(o.amount);
  }
}

void encode(const output_t& o, writer& out) {
  out.write_u64(o.satoshis);
  auto script = bytes_t{};
  if (o.token) {
    auto token_writer = writer{script};
    encode(*o.token, token_writer);
  }
  script.insert(std::end(script), std::begin(o.locking_bytecode),
                std::end(o.locking_bytecode));
  out.write_var_bytes(script);
}

void encode(const input_t& o, writer& out) {
  out.write_hash(o.outpoint.txid);
  out.write_u32(o.outpoint.index);
  out.write_var_bytes(o.unlocking_bytecode);
  out.write_u32(o.sequence);
}

void encode(const transaction_t& o, writer& out) {
  out.write_u32(o.version);
  out.write_compact_size(o.inputs.size());
  for (const auto& input : o.inputs) {
    encode(input, out);
  }
  out.write_compact_size(o.outputs.size());
  for (const auto& output : o.outputs) {
    encode(output, out);
  }
  out.write_u32(o.locktime);
}

void decode(token_t& o, reader& in) {
  if (in.read_u8() != kTokenPrefix) {
    fail("token prefix expected");
  }
  o.category = in.read_hash();
  auto bitfield = in.read_u8();
  if ((bitfield & kTokenReservedBit) != 0) {
    fail("token bitfield uses the reserved bit");
  }

  auto has_nft = (bitfield & kTokenHasNft) != 0;
  auto capability = static_cast<uint8_t>(bitfield & kTokenCapabilityMask);
  if (capability > static_cast<uint8_t>(token_capability_t::minting)) {
    fail(fmt::format("unknown token capability {}", capability));
  }
  if (!has_nft &&
      (capability != 0 || (bitfield & kTokenHasCommitmentLength) != 0)) {
    fail("fungible-only token carries non-fungible fields");
  }
  if (!has_nft && (bitfield & kTokenHasAmount) == 0) {
    fail("token prefix carries neither an amount nor an NFT");
  }

  if (has_nft) {
    auto nft = nft_t{.capability = static_cast<token_capability_t>(capability)};
    if ((bitfield & kTokenHasCommitmentLength) != 0) {
      nft.commitment = in.read_var_bytes();
      if (nft.commitment.empty()) {
        fail("commitment length flag set for an empty commitment");
      }
    }
    o.nft = std::move(nft);
  }

  o.amount = 0;
  if ((bitfield & kTokenHasAmount) != 0) {
    o.amount = in.read_compact_size();
    if (o.amount == 0) {
      fail("token amount flag set for a zero amount");
    }
  }
}

void decode(output_t& o, reader& in) {
  o.satoshis = in.read_u64();
  auto script = in.read_var_bytes();
  auto script_reader = reader{script};
  if (!script.empty() && script.front() == kTokenPrefix) {
    auto token = token_t{};
    decode(token, script_reader);
    o.token = std::move(token);
  } else {
    o.token.reset();
  }
  o.locking_bytecode =
      make_bytes(script_reader.read_bytes(script_reader.remaining()));
}

void decode(input_t& o, reader& in) {
  o.outpoint.txid = in.read_hash();
  o.outpoint.index = in.read_u32();
  o.unlocking_bytecode = in.read_var_bytes();
  o.sequence = in.read_u32();
}

void decode(transaction_t& o, reader& in) {
  o.version = in.read_u32();
  auto input_count = in.read_compact_size();
  if (input_count > in.remaining()) {
    fail("input count exceeds remaining input");
  }
  o.inputs.resize(static_cast<size_t>(input_count));
  for (auto& input : o.inputs) {
    decode(input, in);
  }
  auto output_count = in.read_compact_size();
  if (output_count > in.remaining()) {
    fail("output count exceeds remaining input");
  }
  o.outputs.resize(static_cast<size_t>(output_count));
  for (auto& output : o.outputs) {
    decode(output, in);
  }
  o.locktime = in.read_u32();
}

}  // namespace cann::schema::encoding::bch
