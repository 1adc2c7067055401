#include <cann/common/error.hpp>
#include <cann/locator/utxo_locator.hpp>
#include <cann/protocol/commitment.hpp>
#include <cann/protocol/constants.hpp>
#include <cann/protocol/name.hpp>
#include <cann/resolver/address_resolver.hpp>
#include <cann/resolver/history.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <iterator>
#include <limits>
#include <set>
#include <unordered_set>
#include <utility>

using cann::schema::token_capability_t;

namespace cann::resolver {

namespace {

struct token_position_t final {
  cann::schema::locking_bytecode_t owner;
  int64_t height{};
};

bool is_mempool(const int64_t height) { return height <= 0; }

// Mempool entries sort after every confirmed height.
int64_t ordering_height(const int64_t height) {
  return is_mempool(height) ? std::numeric_limits<int64_t>::max() : height;
}

bool is_ownership_output(const cann::schema::output_t& output,
                         const cann::schema::hash32_t& category,
                         const cann::schema::bytes_t& commitment) {
  return output.token && output.token->category == category &&
         output.token->nft &&
         output.token->nft->capability == token_capability_t::none &&
         output.token->nft->commitment == commitment;
}

std::optional<cann::schema::locking_bytecode_t> transferred_to(
    const cann::schema::transaction_t& tx,
    const cann::schema::hash32_t& category,
    const cann::schema::bytes_t& commitment,
    const cann::schema::locking_bytecode_t& owner) {
  for (const auto& output : tx.outputs) {
    if (is_ownership_output(output, category, commitment) &&
        output.locking_bytecode != owner) {
      return output.locking_bytecode;
    }
  }
  return std::nullopt;
}

// Entries at or after `base` that were not replayed yet, ascending with the
// mempool last. Nothing confirmed follows a mempool base.
std::vector<cann::schema::history_entry_t> entries_from(
    const std::vector<cann::schema::history_entry_t>& history,
    const int64_t base, const std::set<cann::schema::hash32_t>& replayed) {
  auto later = std::vector<cann::schema::history_entry_t>{};
  std::copy_if(std::begin(history), std::end(history),
               std::back_inserter(later), [&](const auto& entry) {
                 if (replayed.contains(entry.txid)) {
                   return false;
                 }
                 return ordering_height(entry.height) >= ordering_height(base);
               });
  std::stable_sort(std::begin(later), std::end(later),
                   [](const auto& lhs, const auto& rhs) {
                     return ordering_height(lhs.height) <
                            ordering_height(rhs.height);
                   });
  return later;
}

}  // namespace

address_resolver::address_resolver(
    const cann::config_t& config,
    const cann::covenant::covenant_set& covenants,
    cann::query::transport& transport,
    cann::query::indexer* indexer)
    : config_{config},
      covenants_{covenants},
      transport_{transport},
      indexer_{indexer} {}

std::vector<std::string> address_resolver::lookup_address(
    const cann::schema::locking_bytecode_t& locking_bytecode) const {
  auto names = std::vector<std::string>{};
  auto seen = std::unordered_set<std::string>{};
  for (const auto& utxo : transport_.get_utxos(locking_bytecode)) {
    if (!cann::schema::has_category(utxo, config_.category) ||
        !utxo.token->nft ||
        utxo.token->nft->capability != token_capability_t::none ||
        utxo.token->nft->commitment.size() <=
            cann::protocol::kRegistrationIdSize) {
      continue;
    }
    auto name = cann::protocol::name_from_ownership_commitment(
        utxo.token->nft->commitment);
    if (name && seen.insert(*name).second) {
      names.push_back(std::move(*name));
    }
  }
  return names;
}

std::optional<cann::schema::locking_bytecode_t> address_resolver::resolve_name(
    const std::string_view name) const {
  return resolve_name(name, config_.indexer_url
                                ? resolution_strategy_t::indexer
                                : resolution_strategy_t::history);
}

std::optional<cann::schema::locking_bytecode_t> address_resolver::resolve_name(
    const std::string_view name, const resolution_strategy_t strategy) const {
  cann::protocol::validate_name(name);
  if (strategy == resolution_strategy_t::indexer && !indexer_) {
    cann::common::throw_error(
        cann::common::error_code::configuration_error,
        fmt::format("name resolution through the indexer at '{}' requires "
                    "an indexer",
                    config_.indexer_url.value_or("")));
  }

  auto commitment = ownership_commitment(name);
  if (!commitment) {
    spdlog::debug("'{}' has no internal authorization token", name);
    return std::nullopt;
  }
  return strategy == resolution_strategy_t::indexer
             ? query_indexer(*commitment)
             : replay_history(name, *commitment);
}

// The lowest registration id among the domain's internal authorization
// tokens identifies the live registration of the name.
std::optional<cann::schema::bytes_t> address_resolver::ownership_commitment(
    const std::string_view name) const {
  auto domain = covenants_.domain(name);
  auto locator = cann::locator::utxo_locator{config_.category};
  auto roles =
      locator.classify_domain(transport_.get_utxos(domain.locking_bytecode));
  if (roles.internal_auth.empty()) {
    return std::nullopt;
  }
  auto registration_id = cann::protocol::decode_registration_id(
      cann::schema::commitment_of(roles.internal_auth.front()));
  return cann::protocol::make_ownership_commitment(registration_id, name);
}

std::optional<cann::schema::locking_bytecode_t>
address_resolver::replay_history(const std::string_view name,
                                 const cann::schema::bytes_t& commitment) const {
  auto domain = covenants_.domain(name);
  auto domain_history = fetch_transactions(
      transport_, transport_.fetch_history(domain.locking_bytecode));

  auto replayed = std::set<cann::schema::hash32_t>{};

  // The claim transaction creates the ownership token.
  auto position = std::optional<token_position_t>{};
  for (const auto& [entry, tx] : domain_history) {
    auto output = std::find_if(
        std::begin(tx.outputs), std::end(tx.outputs), [&](const auto& out) {
          return is_ownership_output(out, config_.category, commitment);
        });
    if (output != std::end(tx.outputs)) {
      position = token_position_t{.owner = output->locking_bytecode,
                                  .height = entry.height};
      replayed.insert(entry.txid);
      break;
    }
  }
  if (!position) {
    spdlog::debug("no claim transaction found for '{}'", name);
    return std::nullopt;
  }

  auto moved = true;
  while (moved) {
    moved = false;
    auto later = entries_from(transport_.fetch_history(position->owner),
                              position->height, replayed);
    for (const auto& [entry, tx] : fetch_transactions(transport_, later)) {
      replayed.insert(entry.txid);
      if (auto next = transferred_to(tx, config_.category, commitment,
                                     position->owner)) {
        spdlog::debug("ownership token of '{}' moved in {}", name,
                      cann::schema::to_hex(entry.txid));
        position = token_position_t{.owner = std::move(*next),
                                    .height = entry.height};
        moved = true;
        break;
      }
    }
  }

  if (!holds_token(position->owner, commitment)) {
    return std::nullopt;
  }
  return position->owner;
}

std::optional<cann::schema::locking_bytecode_t>
address_resolver::query_indexer(const cann::schema::bytes_t& commitment) const {
  spdlog::debug("querying token outputs from {}",
                config_.indexer_url.value_or("the attached indexer"));
  auto outputs = indexer_->find_token_outputs(config_.category, commitment);

  // Unconfirmed outputs when there are any, else the highest confirmed ones.
  auto latest = std::vector<cann::query::token_output_t>{};
  std::copy_if(std::begin(outputs), std::end(outputs),
               std::back_inserter(latest),
               [](const auto& output) { return !output.height; });
  if (latest.empty()) {
    auto top = uint64_t{0};
    for (const auto& output : outputs) {
      top = std::max(top, output.height.value_or(0));
    }
    std::copy_if(std::begin(outputs), std::end(outputs),
                 std::back_inserter(latest),
                 [&](const auto& output) { return output.height == top; });
  }

  // Candidates are checked a window at a time; the first holder wins.
  for (size_t begin = 0; begin < latest.size(); begin += kHistoryFetchWindow) {
    auto end = std::min(latest.size(), begin + kHistoryFetchWindow);
    auto checks = std::vector<std::future<bool>>{};
    for (auto i = begin; i < end; ++i) {
      checks.push_back(std::async(
          std::launch::async, [this, &output = latest[i], &commitment] {
            return holds_token(output.locking_bytecode, commitment);
          }));
    }
    for (auto& check : checks) {
      check.wait();
    }
    auto owner = std::optional<cann::schema::locking_bytecode_t>{};
    for (auto i = begin; i < end; ++i) {
      if (checks[i - begin].get() && !owner) {
        owner = latest[i].locking_bytecode;
      }
    }
    if (owner) {
      return owner;
    }
  }
  return std::nullopt;
}

bool address_resolver::holds_token(
    const cann::schema::locking_bytecode_t& locking_bytecode,
    const cann::schema::bytes_t& commitment) const {
  auto utxos = transport_.get_utxos(locking_bytecode);
  return std::any_of(std::begin(utxos), std::end(utxos), [&](const auto& utxo) {
    return cann::schema::has_category(utxo, config_.category) &&
           cann::schema::commitment_of(utxo) == commitment;
  });
}

}  // namespace cann::resolver
