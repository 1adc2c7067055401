#pragma once

#include <cann/schema/primitives.hpp>

#include <optional>
#include <vector>

namespace cann::query {

struct token_output_t final {
  cann::schema::hash32_t txid{};
  uint32_t index{};
  cann::schema::locking_bytecode_t locking_bytecode;
  // std::nullopt while the transaction is in the mempool.
  std::optional<uint64_t> height;
};

// Optional token-state index (a Chaingraph instance in production).
class indexer {
 public:
  virtual ~indexer() = default;

  // Spent outputs included.
  virtual std::vector<token_output_t> find_token_outputs(
      const cann::schema::hash32_t& category,
      const cann::schema::bytes_t& commitment) = 0;
};

}  // namespace cann::query
