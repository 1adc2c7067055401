#pragma once

#include <cann/assembler/assembler.hpp>
#include <cann/config.hpp>
#include <cann/covenant/covenant_set.hpp>
#include <cann/query/indexer.hpp>
#include <cann/query/transport.hpp>
#include <cann/resolver/address_resolver.hpp>
#include <cann/resolver/domain_resolver.hpp>
#include <cann/resolver/record_resolver.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cann {

// Owns its configuration; the covenant set, transport and indexer must
// outlive it.
class manager final {
 public:
  manager(config_t config,
          const cann::covenant::covenant_set& covenants,
          cann::query::transport& transport,
          cann::query::indexer* indexer = nullptr);

  manager(const manager&) = delete;
  manager& operator=(const manager&) = delete;

  const config_t& config() const { return config_; }

  cann::assembler::transaction_template_t accumulate_tokens(
      const cann::assembler::accumulate_params_t& params) const;
  cann::assembler::transaction_template_t create_auction_transaction(
      const cann::assembler::auction_params_t& params) const;
  cann::assembler::transaction_template_t create_bid_transaction(
      const cann::assembler::bid_params_t& params) const;
  cann::assembler::transaction_template_t create_claim_domain_transaction(
      const cann::assembler::claim_domain_params_t& params) const;
  cann::assembler::transaction_template_t create_records_transaction(
      const cann::assembler::records_params_t& params) const;
  cann::assembler::transaction_template_t penalize_invalid_auction_name(
      const cann::assembler::penalty_params_t& params) const;
  cann::assembler::transaction_template_t penalize_duplicate_auction(
      const cann::assembler::penalty_params_t& params) const;
  cann::assembler::transaction_template_t penalize_illegal_auction(
      const cann::assembler::penalty_params_t& params) const;

  cann::resolver::domain_info_t get_domain(std::string_view name) const;
  cann::resolver::records_t get_records(std::string_view name) const;
  std::vector<cann::resolver::auction_info_t> get_active_auctions() const;
  std::vector<cann::resolver::past_auction_t> get_past_auctions() const;

  std::vector<std::string> lookup_address(
      const cann::schema::locking_bytecode_t& locking_bytecode) const;
  std::optional<cann::schema::locking_bytecode_t> resolve_name(
      std::string_view name) const;
  std::optional<cann::schema::locking_bytecode_t> resolve_name(
      std::string_view name,
      cann::resolver::resolution_strategy_t strategy) const;

 private:
  config_t config_;
  cann::assembler::assembler assembler_;
  cann::resolver::domain_resolver domains_;
  cann::resolver::record_resolver records_;
  cann::resolver::address_resolver addresses_;
};

}  // namespace cann
