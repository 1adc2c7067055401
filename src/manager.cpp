#include <cann/manager.hpp>

#include <utility>

namespace cann {

manager::manager(config_t config,
                 const cann::covenant::covenant_set& covenants,
                 cann::query::transport& transport,
                 cann::query::indexer* indexer)
    : config_{std::move(config)},
      assembler_{config_, covenants, transport},
      domains_{config_, covenants, transport},
      records_{config_, covenants, transport},
      addresses_{config_, covenants, transport, indexer} {}

cann::assembler::transaction_template_t manager::accumulate_tokens(
    const cann::assembler::accumulate_params_t& params) const {
  return assembler_.build_accumulate_transaction(params);
}

cann::assembler::transaction_template_t manager::create_auction_transaction(
    const cann::assembler::auction_params_t& params) const {
  return assembler_.build_auction_transaction(params);
}

cann::assembler::transaction_template_t manager::create_bid_transaction(
    const cann::assembler::bid_params_t& params) const {
  return assembler_.build_bid_transaction(params);
}

cann::assembler::transaction_template_t
manager::create_claim_domain_transaction(
    const cann::assembler::claim_domain_params_t& params) const {
  return assembler_.build_claim_domain_transaction(params);
}

cann::assembler::transaction_template_t manager::create_records_transaction(
    const cann::assembler::records_params_t& params) const {
  return assembler_.build_records_transaction(params);
}

cann::assembler::transaction_template_t manager::penalize_invalid_auction_name(
    const cann::assembler::penalty_params_t& params) const {
  return assembler_.build_penalize_invalid_name_transaction(params);
}

cann::assembler::transaction_template_t manager::penalize_duplicate_auction(
    const cann::assembler::penalty_params_t& params) const {
  return assembler_.build_penalize_duplicate_auction_transaction(params);
}

cann::assembler::transaction_template_t manager::penalize_illegal_auction(
    const cann::assembler::penalty_params_t& params) const {
  return assembler_.build_penalize_illegal_auction_transaction(params);
}

cann::resolver::domain_info_t manager::get_domain(
    const std::string_view name) const {
  return domains_.get_domain(name);
}

cann::resolver::records_t manager::get_records(
    const std::string_view name) const {
  return records_.get_records(name);
}

std::vector<cann::resolver::auction_info_t> manager::get_active_auctions()
    const {
  return domains_.get_active_auctions();
}

std::vector<cann::resolver::past_auction_t> manager::get_past_auctions()
    const {
  return domains_.get_past_auctions();
}

std::vector<std::string> manager::lookup_address(
    const cann::schema::locking_bytecode_t& locking_bytecode) const {
  return addresses_.lookup_address(locking_bytecode);
}

std::optional<cann::schema::locking_bytecode_t> manager::resolve_name(
    const std::string_view name) const {
  return addresses_.resolve_name(name);
}

std::optional<cann::schema::locking_bytecode_t> manager::resolve_name(
    const std::string_view name,
    const cann::resolver::resolution_strategy_t strategy) const {
  return addresses_.resolve_name(name, strategy);
}

}  // namespace cann
