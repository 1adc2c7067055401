#pragma once

#include <cann/assembler/parameters.hpp>
#include <cann/assembler/transaction_builder.hpp>
#include <cann/config.hpp>
#include <cann/covenant/covenant_set.hpp>
#include <cann/locator/utxo_locator.hpp>
#include <cann/query/transport.hpp>

namespace cann::assembler {

/// Builds the unsigned protocol transactions.
///
/// Every call fetches a fresh UTXO snapshot, locates the role UTXOs it needs
/// and returns a complete fee-adjusted template, or throws
/// cann::common::error. Nothing is cached between calls.
class assembler final {
 public:
  assembler(const cann::config_t& config,
            const cann::covenant::covenant_set& covenants,
            cann::query::transport& transport);

  /// Move the fungible amount of one thread into the registration counter.
  transaction_template_t build_accumulate_transaction(
      const accumulate_params_t& params) const;

  /// Open the auction for a new name at or above its decayed price.
  ///
  /// Consumes the next registration id; the payer's coin must cover the bid
  /// plus kMinimalDeductionInAuction.
  transaction_template_t build_auction_transaction(
      const auction_params_t& params) const;

  /// Outbid the running auction and refund the previous bidder.
  transaction_template_t build_bid_transaction(
      const bid_params_t& params) const;

  /// Settle a won auction into the domain's authorization tokens and the
  /// bidder's ownership token. The auction input carries the configured
  /// `min_wait_time` as its relative timelock; the covenant checks it.
  transaction_template_t build_claim_domain_transaction(
      const claim_domain_params_t& params) const;

  /// Append records (one OP_RETURN output each) to an owned domain.
  transaction_template_t build_records_transaction(
      const records_params_t& params) const;

  /// Burn the later of two auctions running for the same name.
  transaction_template_t build_penalize_duplicate_auction_transaction(
      const penalty_params_t& params) const;

  /// Burn an auction running for a name that is already registered.
  transaction_template_t build_penalize_illegal_auction_transaction(
      const penalty_params_t& params) const;

  /// Burn an auction whose name contains a disallowed character.
  transaction_template_t build_penalize_invalid_name_transaction(
      const penalty_params_t& params) const;

 private:
  transaction_builder make_builder() const;

  const cann::config_t& config_;
  const cann::covenant::covenant_set& covenants_;
  cann::query::transport& transport_;
  cann::locator::utxo_locator locator_;
};

}  // namespace cann::assembler
