#pragma once

#include <cann/schema/primitives.hpp>
#include <cann/schema/token_capability.hpp>

#include <cstdint>
#include <optional>

namespace cann::schema {

struct outpoint_t final {
  hash32_t txid{};  // display order
  uint32_t index{};

  bool operator==(const outpoint_t&) const = default;
};

struct nft_t final {
  token_capability_t capability{token_capability_t::none};
  bytes_t commitment;

  bool operator==(const nft_t&) const = default;
};

struct token_t final {
  hash32_t category{};  // display order
  token_amount_t amount{};
  std::optional<nft_t> nft;

  bool operator==(const token_t&) const = default;
};

// `locking_bytecode` is the address the UTXO was listed under.
struct utxo_t final {
  outpoint_t outpoint;
  satoshis_t satoshis{};
  std::optional<token_t> token;
  locking_bytecode_t locking_bytecode;
  std::optional<uint64_t> height;

  bool operator==(const utxo_t&) const = default;
};

struct history_entry_t final {
  hash32_t txid{};
  // Zero or negative for mempool entries.
  int64_t height{};
};

bool has_category(const utxo_t& utxo, const hash32_t& category);
bool has_capability(const utxo_t& utxo, token_capability_t capability);
const bytes_t& commitment_of(const utxo_t& utxo);
token_amount_t token_amount_of(const utxo_t& utxo);

}  // namespace cann::schema
