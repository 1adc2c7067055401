#pragma once

#include <cann/config.hpp>
#include <cann/covenant/covenant_set.hpp>
#include <cann/query/indexer.hpp>
#include <cann/query/transport.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cann::resolver {

enum class resolution_strategy_t : uint8_t { history = 0, indexer = 1 };

// Maps owners to names and names to owners through ownership tokens.
class address_resolver final {
 public:
  // `indexer` may be null.
  address_resolver(const cann::config_t& config,
                   const cann::covenant::covenant_set& covenants,
                   cann::query::transport& transport,
                   cann::query::indexer* indexer = nullptr);

  std::vector<std::string> lookup_address(
      const cann::schema::locking_bytecode_t& locking_bytecode) const;

  // Holder of the ownership token of `name`; std::nullopt once the token is
  // gone. The indexer strategy without an indexer is a configuration_error.
  std::optional<cann::schema::locking_bytecode_t> resolve_name(
      std::string_view name, resolution_strategy_t strategy) const;

  // Uses the indexer when `indexer_url` is configured.
  std::optional<cann::schema::locking_bytecode_t> resolve_name(
      std::string_view name) const;

 private:
  std::optional<cann::schema::bytes_t> ownership_commitment(
      std::string_view name) const;
  std::optional<cann::schema::locking_bytecode_t> replay_history(
      std::string_view name, const cann::schema::bytes_t& commitment) const;
  std::optional<cann::schema::locking_bytecode_t> query_indexer(
      const cann::schema::bytes_t& commitment) const;
  bool holds_token(const cann::schema::locking_bytecode_t& locking_bytecode,
                   const cann::schema::bytes_t& commitment) const;

  const cann::config_t& config_;
  const cann::covenant::covenant_set& covenants_;
  cann::query::transport& transport_;
  cann::query::indexer* indexer_;
};

}  // namespace cann::resolver
