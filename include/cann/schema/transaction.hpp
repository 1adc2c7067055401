#pragma once

#include <cann/schema/primitives.hpp>
#include <cann/schema/utxo.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace cann::schema {

inline constexpr auto kDefaultSequence = uint32_t{0xffffffff};

struct output_t final {
  locking_bytecode_t locking_bytecode;
  satoshis_t satoshis{};
  std::optional<token_t> token;

  bool operator==(const output_t&) const = default;
};

struct input_t final {
  outpoint_t outpoint;
  bytes_t unlocking_bytecode;
  uint32_t sequence{kDefaultSequence};

  bool operator==(const input_t&) const = default;
};

struct transaction_t final {
  uint32_t version{2};
  std::vector<input_t> inputs;
  std::vector<output_t> outputs;
  uint32_t locktime{};

  bool operator==(const transaction_t&) const = default;
};

output_t make_source_output(const utxo_t& utxo);

}  // namespace cann::schema
