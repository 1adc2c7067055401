#include <cann/protocol/commitment.hpp>
#include <cann/protocol/name.hpp>
#include <cann/resolver/domain_resolver.hpp>
#include <cann/resolver/history.hpp>

#include <spdlog/spdlog.h>

#include <future>

using cann::covenant::covenant_role_t;
using cann::schema::domain_status_t;
using cann::schema::token_capability_t;

namespace cann::resolver {

namespace {

constexpr auto kClaimMintingOutput = size_t{2};
constexpr auto kClaimOwnershipOutput = size_t{5};
constexpr auto kClaimAuctionInput = size_t{3};

bool output_has_category(const cann::schema::output_t& output,
                         const cann::schema::hash32_t& category) {
  return output.token && output.token->category == category;
}

// Claim transactions mint the domain tokens from the domain minting coin
// (output 2) and send the ownership token to the bidder (output 5).
bool is_claim_transaction(const cann::schema::transaction_t& tx,
                          const cann::schema::hash32_t& category) {
  if (tx.inputs.size() <= kClaimAuctionInput ||
      tx.outputs.size() <= kClaimOwnershipOutput) {
    return false;
  }
  for (const auto index : {size_t{0}, size_t{2}, size_t{3}, size_t{4},
                           size_t{5}}) {
    if (!output_has_category(tx.outputs[index], category)) {
      return false;
    }
  }
  const auto& minting = tx.outputs[kClaimMintingOutput].token;
  return minting->nft &&
         minting->nft->capability == token_capability_t::minting &&
         tx.outputs[kClaimOwnershipOutput].token->nft.has_value();
}

}  // namespace

std::optional<auction_info_t> make_auction_info(
    const cann::schema::utxo_t& utxo) {
  const auto& commitment = cann::schema::commitment_of(utxo);
  auto name = cann::protocol::name_from_auction_commitment(commitment);
  auto bidder = cann::protocol::bidder_from_auction_commitment(commitment);
  if (!name || !bidder) {
    return std::nullopt;
  }
  return auction_info_t{.name = std::move(*name),
                        .registration_id = cann::schema::token_amount_of(utxo),
                        .current_bid = utxo.satoshis,
                        .bidder = *bidder,
                        .utxo = utxo};
}

domain_resolver::domain_resolver(const cann::config_t& config,
                                 const cann::covenant::covenant_set& covenants,
                                 cann::query::transport& transport)
    : config_{config},
      covenants_{covenants},
      transport_{transport},
      locator_{config.category} {}

domain_info_t domain_resolver::get_domain(const std::string_view name) const {
  auto info = domain_info_t{.name = std::string{name},
                            .covenant = covenants_.domain(name)};
  const auto& registry = covenants_.get(covenant_role_t::registry);

  auto registry_future =
      std::async(std::launch::async, [this, &registry] {
        return transport_.get_utxos(registry.locking_bytecode);
      });
  auto domain_future = std::async(std::launch::async, [this, &info] {
    return transport_.get_utxos(info.covenant.locking_bytecode);
  });
  auto registry_utxos = registry_future.get();
  info.utxos = domain_future.get();

  if (locator_.classify_domain(info.utxos).holds_category) {
    info.status = domain_status_t::registered;
  } else if (auto auction = locator_.find_running_auction(registry_utxos, name)) {
    info.status = domain_status_t::auctioning;
    info.auction = make_auction_info(*auction);
  } else {
    info.status = cann::protocol::is_valid_name(name)
                      ? domain_status_t::available
                      : domain_status_t::invalid;
  }

  spdlog::debug("domain '{}' is {}", name, cann::schema::to_string(info.status));
  return info;
}

std::vector<auction_info_t> domain_resolver::get_active_auctions() const {
  const auto& registry = covenants_.get(covenant_role_t::registry);
  auto auctions = std::vector<auction_info_t>{};
  for (const auto& utxo : locator_.find_running_auctions(
           transport_.get_utxos(registry.locking_bytecode))) {
    if (auto info = make_auction_info(utxo)) {
      auctions.push_back(std::move(*info));
    }
  }
  return auctions;
}

std::vector<past_auction_t> domain_resolver::get_past_auctions() const {
  const auto& factory = covenants_.get(covenant_role_t::domain_factory);
  auto history = transport_.fetch_history(factory.locking_bytecode);

  auto past = std::vector<past_auction_t>{};
  for (const auto& [entry, tx] : fetch_transactions(transport_, history)) {
    if (!is_claim_transaction(tx, config_.category)) {
      continue;
    }
    auto name = cann::protocol::name_from_ownership_commitment(
        tx.outputs[kClaimOwnershipOutput].token->nft->commitment);
    if (!name) {
      continue;
    }

    // The auction coin spent by the claim holds the winning bid.
    const auto& spent = tx.inputs[kClaimAuctionInput].outpoint;
    auto auction_tx = fetch_transaction(transport_, spent.txid);
    if (!auction_tx || spent.index >= auction_tx->outputs.size()) {
      continue;
    }
    past.push_back(past_auction_t{
        .name = std::move(*name),
        .final_amount = auction_tx->outputs[spent.index].satoshis,
        .txid = entry.txid,
        .height = entry.height});
  }
  return past;
}

}  // namespace cann::resolver
