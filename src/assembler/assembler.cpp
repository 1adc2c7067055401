#include <cann/assembler/assembler.hpp>
#include <cann/common/error.hpp>
#include <cann/protocol/commitment.hpp>
#include <cann/protocol/constants.hpp>
#include <cann/protocol/name.hpp>
#include <cann/protocol/price.hpp>
#include <cann/script/script.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <utility>

using cann::covenant::covenant_role_t;
using cann::schema::output_t;
using cann::schema::token_capability_t;
using cann::schema::utxo_t;

namespace cann::assembler {

namespace {

using utxo_future_t = std::future<std::vector<utxo_t>>;

utxo_future_t fetch_utxos(cann::query::transport& transport,
                          cann::schema::locking_bytecode_t locking_bytecode) {
  return std::async(std::launch::async,
                    [&transport, locking = std::move(locking_bytecode)] {
                      return transport.get_utxos(locking);
                    });
}

cann::schema::bytes_t unlock(const cann::covenant::covenant_t& covenant,
                             const cann::covenant::unlock_request_t& request) {
  if (!covenant.unlock) {
    cann::common::throw_error(
        cann::common::error_code::configuration_error,
        fmt::format("covenant {} has no unlock builder",
                    cann::covenant::to_string(covenant.role)));
  }
  return covenant.unlock(request);
}

cann::schema::hash20_t require_p2pkh(
    const cann::schema::locking_bytecode_t& locking_bytecode,
    const std::string_view what) {
  auto hash = cann::script::try_extract_p2pkh_hash(locking_bytecode);
  if (!hash) {
    cann::common::throw_error(
        cann::common::error_code::invalid_argument,
        fmt::format("{} must be a P2PKH locking bytecode", what));
  }
  return *hash;
}

// Same coin and place with a new fungible amount.
output_t with_token_amount(const utxo_t& utxo,
                           const cann::schema::token_amount_t amount) {
  auto output = cann::schema::make_source_output(utxo);
  output.token->amount = amount;
  return output;
}

output_t make_domain_token_output(
    const cann::schema::locking_bytecode_t& locking_bytecode,
    const cann::schema::hash32_t& category,
    cann::schema::bytes_t commitment) {
  return output_t{
      .locking_bytecode = locking_bytecode,
      .satoshis = cann::protocol::kDomainTokenSatoshis,
      .token = cann::schema::token_t{
          .category = category,
          .amount = 0,
          .nft = cann::schema::nft_t{.capability = token_capability_t::none,
                                     .commitment = std::move(commitment)}}};
}

const utxo_t& require_auction(const cann::locator::registry_roles_t& roles) {
  if (roles.auctions.empty()) {
    cann::common::throw_not_found("RunningAuctionUTXO");
  }
  return roles.auctions.front();
}

void log_template(const std::string_view operation,
                  const std::string_view name,
                  const transaction_template_t& result) {
  spdlog::info("built {} transaction for '{}': {} bytes, {} sat fee",
               operation, name, result.size, result.fee);
}

}  // namespace

assembler::assembler(const cann::config_t& config,
                     const cann::covenant::covenant_set& covenants,
                     cann::query::transport& transport)
    : config_{config},
      covenants_{covenants},
      transport_{transport},
      locator_{config.category} {}

transaction_builder assembler::make_builder() const {
  return transaction_builder{config_.fee_per_byte};
}

transaction_template_t assembler::build_accumulate_transaction(
    const accumulate_params_t& params) const {
  const auto& registry = covenants_.get(covenant_role_t::registry);
  const auto& accumulator = covenants_.get(covenant_role_t::accumulator);

  auto registry_utxos = fetch_utxos(transport_, registry.locking_bytecode);
  auto accumulator_utxos =
      fetch_utxos(transport_, accumulator.locking_bytecode);
  auto payer_utxos = fetch_utxos(transport_, params.payer);

  auto roles = locator_.classify_registry(registry_utxos.get(),
                                          accumulator.locking_bytecode);
  const auto& thread = cann::locator::require_role(roles.thread, "ThreadUTXO");
  const auto& counter = cann::locator::require_role(
      roles.registration_counter, "RegistrationCounterUTXO");
  if (roles.threads_with_token.empty()) {
    cann::common::throw_not_found("ThreadWithTokenUTXO");
  }
  const auto& thread_with_token = roles.threads_with_token.front();
  auto authorized = locator_.find_authorized_contract_utxo(
      accumulator_utxos.get(), "Accumulator");
  auto funding = locator_.find_funding_utxo(payer_utxos.get());

  auto builder = make_builder();
  builder.add_input(thread, unlock(registry, cann::covenant::call_t{}))
      .add_input(authorized, unlock(accumulator, cann::covenant::call_t{}))
      .add_input(counter, unlock(registry, cann::covenant::call_t{}))
      .add_input(thread_with_token, unlock(registry, cann::covenant::call_t{}))
      .add_signer_input(funding)
      .add_output(cann::schema::make_source_output(thread))
      .add_output(cann::schema::make_source_output(authorized))
      .add_output(with_token_amount(
          counter, counter.token->amount + thread_with_token.token->amount))
      .add_output(with_token_amount(thread_with_token, 0))
      .set_change_output(params.payer, funding.satoshis);

  auto result = builder.build();
  spdlog::info("built accumulate transaction: {} bytes, {} sat fee",
               result.size, result.fee);
  return result;
}

transaction_template_t assembler::build_auction_transaction(
    const auction_params_t& params) const {
  cann::protocol::validate_name(params.name);
  auto payer_hash = require_p2pkh(params.payer, "auction payer");

  const auto& registry = covenants_.get(covenant_role_t::registry);
  const auto& auction = covenants_.get(covenant_role_t::auction);

  auto registry_utxos = fetch_utxos(transport_, registry.locking_bytecode);
  auto auction_utxos = fetch_utxos(transport_, auction.locking_bytecode);
  auto payer_utxos = fetch_utxos(transport_, params.payer);

  auto roles = locator_.classify_registry(registry_utxos.get(),
                                          auction.locking_bytecode);
  const auto& thread = cann::locator::require_role(roles.thread, "ThreadUTXO");
  const auto& counter = cann::locator::require_role(
      roles.registration_counter, "RegistrationCounterUTXO");

  auto registration_id = cann::protocol::decode_registration_id(
      cann::schema::commitment_of(counter));
  auto price = cann::protocol::auction_price(registration_id,
                                             config_.min_starting_bid);
  if (params.amount < price) {
    cann::common::throw_error(
        cann::common::error_code::insufficient_bid,
        fmt::format("auction for '{}' needs at least {} sats, got {}",
                    params.name, price, params.amount));
  }
  if (counter.token->amount < registration_id) {
    cann::common::throw_error(
        cann::common::error_code::invalid_argument,
        fmt::format("registration counter holds {} tokens, id {} needs more",
                    counter.token->amount, registration_id));
  }

  auto authorized =
      locator_.find_authorized_contract_utxo(auction_utxos.get(), "Auction");
  auto funding = locator_.find_funding_utxo(
      payer_utxos.get(),
      params.amount + cann::protocol::kMinimalDeductionInAuction);

  auto next_counter = cann::schema::make_source_output(counter);
  next_counter.token->amount -= registration_id;
  next_counter.token->nft->commitment =
      cann::protocol::encode_registration_id(registration_id + 1);

  auto new_auction = output_t{
      .locking_bytecode = registry.locking_bytecode,
      .satoshis = params.amount,
      .token = cann::schema::token_t{
          .category = config_.category,
          .amount = registration_id,
          .nft = cann::schema::nft_t{
              .capability = token_capability_t::mutable_,
              .commitment = cann::protocol::make_auction_commitment(
                  payer_hash, params.name)}}};

  auto builder = make_builder();
  builder.add_input(thread, unlock(registry, cann::covenant::call_t{}))
      .add_input(authorized,
                 unlock(auction, cann::covenant::call_with_name_t{
                                     cann::protocol::name_to_bytes(
                                         params.name)}))
      .add_input(counter, unlock(registry, cann::covenant::call_t{}))
      .add_signer_input(funding)
      .add_output(cann::schema::make_source_output(thread))
      .add_output(cann::schema::make_source_output(authorized))
      .add_output(std::move(next_counter))
      .add_output(std::move(new_auction))
      .add_op_return_output(params.name)
      .set_change_output(params.payer, funding.satoshis, params.amount);

  auto result = builder.build();
  log_template("auction", params.name, result);
  return result;
}

transaction_template_t assembler::build_bid_transaction(
    const bid_params_t& params) const {
  cann::protocol::validate_name(params.name);
  auto bidder_hash = require_p2pkh(params.bidder, "bidder");

  const auto& registry = covenants_.get(covenant_role_t::registry);
  const auto& bid = covenants_.get(covenant_role_t::bid);

  auto registry_utxos = fetch_utxos(transport_, registry.locking_bytecode);
  auto bid_utxos = fetch_utxos(transport_, bid.locking_bytecode);
  auto bidder_utxos = fetch_utxos(transport_, params.bidder);

  auto roles = locator_.classify_registry(
      registry_utxos.get(), bid.locking_bytecode, params.name);
  const auto& thread = cann::locator::require_role(roles.thread, "ThreadUTXO");
  const auto& running = require_auction(roles);

  auto required = cann::protocol::minimum_bid(
      running.satoshis, config_.min_bid_increase_percentage);
  if (params.amount < required) {
    cann::common::throw_error(
        cann::common::error_code::insufficient_bid,
        fmt::format("bid for '{}' needs at least {} sats, got {}", params.name,
                    required, params.amount));
  }

  auto previous_bidder = cann::protocol::bidder_from_auction_commitment(
      cann::schema::commitment_of(running));
  if (!previous_bidder) {
    cann::common::throw_error(cann::common::error_code::decode_failure,
                              "auction commitment carries no bidder");
  }

  auto authorized =
      locator_.find_authorized_contract_utxo(bid_utxos.get(), "Bid");
  auto funding = locator_.find_funding_utxo(bidder_utxos.get(), params.amount);

  auto raised = cann::schema::make_source_output(running);
  raised.satoshis = params.amount;
  raised.token->nft->commitment =
      cann::protocol::make_auction_commitment(bidder_hash, params.name);

  auto builder = make_builder();
  builder.add_input(thread, unlock(registry, cann::covenant::call_t{}))
      .add_input(authorized, unlock(bid, cann::covenant::call_t{}))
      .add_input(running, unlock(registry, cann::covenant::call_t{}))
      .add_signer_input(funding)
      .add_output(cann::schema::make_source_output(thread))
      .add_output(cann::schema::make_source_output(authorized))
      .add_output(std::move(raised))
      .add_output(output_t{.locking_bytecode =
                               cann::script::make_p2pkh_locking_bytecode(
                                   *previous_bidder),
                           .satoshis = running.satoshis})
      .set_change_output(params.bidder, funding.satoshis, params.amount);

  auto result = builder.build();
  log_template("bid", params.name, result);
  return result;
}

transaction_template_t assembler::build_claim_domain_transaction(
    const claim_domain_params_t& params) const {
  cann::protocol::validate_name(params.name);

  const auto& registry = covenants_.get(covenant_role_t::registry);
  const auto& factory = covenants_.get(covenant_role_t::domain_factory);
  auto domain = covenants_.domain(params.name);

  auto registry_utxos = fetch_utxos(transport_, registry.locking_bytecode);
  auto factory_utxos = fetch_utxos(transport_, factory.locking_bytecode);

  auto roles = locator_.classify_registry(
      registry_utxos.get(), factory.locking_bytecode, params.name);
  const auto& thread = cann::locator::require_role(roles.thread, "ThreadUTXO");
  const auto& minting =
      cann::locator::require_role(roles.domain_minting, "DomainMintingUTXO");
  const auto& running = require_auction(roles);
  auto authorized = locator_.find_authorized_contract_utxo(
      factory_utxos.get(), "DomainFactory");

  auto bidder_hash = cann::protocol::bidder_from_auction_commitment(
      cann::schema::commitment_of(running));
  if (!bidder_hash) {
    cann::common::throw_error(cann::common::error_code::decode_failure,
                              "auction commitment carries no bidder");
  }
  auto bidder = cann::script::make_p2pkh_locking_bytecode(*bidder_hash);
  auto bidder_coin = locator_.find_bidder_utxo(transport_.get_utxos(bidder));

  auto registration_id = running.token->amount;
  auto incentive = cann::schema::satoshis_t{0};
  if (registration_id <= cann::protocol::kIncentiveScale) {
    incentive =
        cann::protocol::creator_incentive(running.satoshis, registration_id);
  }
  auto pays_incentive = incentive > cann::protocol::kMinimalCreatorIncentive;
  if (pays_incentive && !config_.creator_incentive_address) {
    cann::common::throw_error(
        cann::common::error_code::configuration_error,
        "claim requires a creator incentive address");
  }
  // The platform fee goes to the bidder when no platform address is set.
  auto platform_fee = cann::protocol::platform_fee(
      running.satoshis, config_.max_platform_fee_percentage);
  auto minted = 3 * cann::protocol::kDomainTokenSatoshis +
                (pays_incentive ? incentive : 0) + platform_fee;
  if (running.satoshis < minted) {
    cann::common::throw_error(
        cann::common::error_code::insufficient_funds,
        fmt::format("auction of {} sats cannot fund {} sats of claim outputs",
                    running.satoshis, minted));
  }

  auto builder = make_builder();
  builder.add_input(thread, unlock(registry, cann::covenant::call_t{}))
      .add_input(authorized, unlock(factory, cann::covenant::call_t{}))
      .add_input(minting, unlock(registry, cann::covenant::call_t{}))
      .add_input(running, unlock(registry, cann::covenant::call_t{}),
                 config_.min_wait_time)
      .add_signer_input(bidder_coin)
      .add_output(with_token_amount(thread,
                                    thread.token->amount + registration_id))
      .add_output(cann::schema::make_source_output(authorized))
      .add_output(cann::schema::make_source_output(minting))
      .add_output(make_domain_token_output(domain.locking_bytecode,
                                           config_.category, {}))
      .add_output(make_domain_token_output(
          domain.locking_bytecode, config_.category,
          cann::protocol::encode_registration_id(registration_id)))
      .add_output(make_domain_token_output(
          bidder, config_.category,
          cann::protocol::make_ownership_commitment(registration_id,
                                                    params.name)));
  if (pays_incentive) {
    builder.add_output(
        output_t{.locking_bytecode = *config_.creator_incentive_address,
                 .satoshis = incentive});
  }
  if (platform_fee > 0) {
    builder.add_output(output_t{
        .locking_bytecode = config_.platform_fee_address.value_or(bidder),
        .satoshis = platform_fee});
  }
  builder.set_change_output(bidder, bidder_coin.satoshis);

  auto result = builder.build();
  log_template("claim", params.name, result);
  return result;
}

transaction_template_t assembler::build_records_transaction(
    const records_params_t& params) const {
  cann::protocol::validate_name(params.name);
  if (params.records.empty() ||
      std::any_of(std::begin(params.records), std::end(params.records),
                  [](const std::string& record) { return record.empty(); })) {
    cann::common::throw_error(cann::common::error_code::invalid_argument,
                              "records must be non-empty strings");
  }

  auto domain = covenants_.domain(params.name);
  auto domain_utxos = fetch_utxos(transport_, domain.locking_bytecode);
  auto owner_utxos_future = fetch_utxos(transport_, params.owner);
  auto owner_utxos = owner_utxos_future.get();

  auto ownership_slot = locator_.find_ownership_utxo(owner_utxos, params.name);
  const auto& ownership =
      cann::locator::require_role(ownership_slot, "OwnershipUTXO");
  auto auth_commitment = cann::protocol::encode_registration_id(
      cann::protocol::decode_registration_id(
          cann::schema::commitment_of(ownership)));

  auto domain_roles = locator_.classify_domain(domain_utxos.get());
  auto internal = std::find_if(
      std::begin(domain_roles.internal_auth),
      std::end(domain_roles.internal_auth), [&](const utxo_t& utxo) {
        return cann::schema::commitment_of(utxo) == auth_commitment;
      });
  if (internal == std::end(domain_roles.internal_auth)) {
    cann::common::throw_not_found("InternalAuthUTXO");
  }
  auto funding = locator_.find_funding_utxo(owner_utxos);

  auto builder = make_builder();
  builder.add_input(*internal, unlock(domain, cann::covenant::use_auth_t{1}))
      .add_signer_input(ownership)
      .add_signer_input(funding)
      .add_output(cann::schema::make_source_output(*internal))
      .add_output(cann::schema::make_source_output(ownership));
  for (const auto& record : params.records) {
    builder.add_op_return_output(record);
  }
  builder.set_change_output(params.owner, funding.satoshis);

  auto result = builder.build();
  log_template("records", params.name, result);
  return result;
}

transaction_template_t assembler::build_penalize_duplicate_auction_transaction(
    const penalty_params_t& params) const {
  const auto& registry = covenants_.get(covenant_role_t::registry);
  const auto& resolver =
      covenants_.get(covenant_role_t::auction_conflict_resolver);

  auto registry_utxos = fetch_utxos(transport_, registry.locking_bytecode);
  auto resolver_utxos = fetch_utxos(transport_, resolver.locking_bytecode);

  auto roles = locator_.classify_registry(
      registry_utxos.get(), resolver.locking_bytecode, params.name);
  const auto& thread = cann::locator::require_role(roles.thread, "ThreadUTXO");
  if (roles.auctions.size() < 2) {
    cann::common::throw_not_found("DuplicateAuctionUTXO");
  }
  // The earlier registration keeps running.
  const auto& valid = roles.auctions[0];
  const auto& duplicate = roles.auctions[1];
  auto authorized = locator_.find_authorized_contract_utxo(
      resolver_utxos.get(), "AuctionConflictResolver");

  auto builder = make_builder();
  builder.add_input(thread, unlock(registry, cann::covenant::call_t{}))
      .add_input(authorized, unlock(resolver, cann::covenant::call_t{}))
      .add_input(valid, unlock(registry, cann::covenant::call_t{}))
      .add_input(duplicate, unlock(registry, cann::covenant::call_t{}))
      .add_output(with_token_amount(
          thread, thread.token->amount + duplicate.token->amount))
      .add_output(cann::schema::make_source_output(authorized))
      .add_output(cann::schema::make_source_output(valid))
      .set_change_output(params.reward_to, duplicate.satoshis);

  auto result = builder.build();
  log_template("duplicate auction penalty", params.name, result);
  return result;
}

transaction_template_t assembler::build_penalize_illegal_auction_transaction(
    const penalty_params_t& params) const {
  const auto& registry = covenants_.get(covenant_role_t::registry);
  const auto& guard = covenants_.get(covenant_role_t::domain_ownership_guard);
  auto domain = covenants_.domain(params.name);

  auto registry_utxos = fetch_utxos(transport_, registry.locking_bytecode);
  auto guard_utxos = fetch_utxos(transport_, guard.locking_bytecode);
  auto domain_utxos = fetch_utxos(transport_, domain.locking_bytecode);

  auto roles = locator_.classify_registry(
      registry_utxos.get(), guard.locking_bytecode, params.name);
  const auto& thread = cann::locator::require_role(roles.thread, "ThreadUTXO");
  const auto& running = require_auction(roles);
  auto domain_roles = locator_.classify_domain(domain_utxos.get());
  const auto& external = cann::locator::require_role(
      domain_roles.external_auth, "ExternalAuthUTXO");
  auto authorized = locator_.find_authorized_contract_utxo(
      guard_utxos.get(), "DomainOwnershipGuard");

  auto builder = make_builder();
  builder.add_input(thread, unlock(registry, cann::covenant::call_t{}))
      .add_input(authorized, unlock(guard, cann::covenant::call_t{}))
      .add_input(external, unlock(domain, cann::covenant::use_auth_t{0}))
      .add_input(running, unlock(registry, cann::covenant::call_t{}))
      .add_output(with_token_amount(
          thread, thread.token->amount + running.token->amount))
      .add_output(cann::schema::make_source_output(authorized))
      .add_output(cann::schema::make_source_output(external))
      .set_change_output(params.reward_to, running.satoshis);

  auto result = builder.build();
  log_template("illegal auction penalty", params.name, result);
  return result;
}

transaction_template_t assembler::build_penalize_invalid_name_transaction(
    const penalty_params_t& params) const {
  auto invalid_index =
      cann::protocol::find_first_invalid_character_index(params.name);
  if (invalid_index == cann::protocol::kNoInvalidCharacter) {
    cann::common::throw_error(
        cann::common::error_code::invalid_argument,
        fmt::format("name '{}' has no invalid character", params.name));
  }

  const auto& registry = covenants_.get(covenant_role_t::registry);
  const auto& enforcer =
      covenants_.get(covenant_role_t::auction_name_enforcer);

  auto registry_utxos = fetch_utxos(transport_, registry.locking_bytecode);
  auto enforcer_utxos = fetch_utxos(transport_, enforcer.locking_bytecode);

  auto roles = locator_.classify_registry(
      registry_utxos.get(), enforcer.locking_bytecode, params.name);
  const auto& thread = cann::locator::require_role(roles.thread, "ThreadUTXO");
  const auto& running = require_auction(roles);
  auto authorized = locator_.find_authorized_contract_utxo(
      enforcer_utxos.get(), "AuctionNameEnforcer");

  auto builder = make_builder();
  builder.add_input(thread, unlock(registry, cann::covenant::call_t{}))
      .add_input(authorized,
                 unlock(enforcer,
                        cann::covenant::call_with_index_t{invalid_index}))
      .add_input(running, unlock(registry, cann::covenant::call_t{}))
      .add_output(with_token_amount(
          thread, thread.token->amount + running.token->amount))
      .add_output(cann::schema::make_source_output(authorized))
      .set_change_output(params.reward_to, running.satoshis);

  auto result = builder.build();
  log_template("invalid name penalty", params.name, result);
  return result;
}

}  // namespace cann::assembler
