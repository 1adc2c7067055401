#include <cann/common/error.hpp>
#include <cann/locator/utxo_locator.hpp>
#include <cann/protocol/commitment.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using cann::schema::token_capability_t;
using cann::schema::utxo_t;

namespace cann::locator {

namespace {

std::string describe(const utxo_t& utxo) {
  return fmt::format("{}:{}", cann::schema::to_hex(utxo.outpoint.txid),
                     utxo.outpoint.index);
}

void sort_by_token_amount(std::vector<utxo_t>& utxos) {
  std::stable_sort(std::begin(utxos), std::end(utxos),
                   [](const utxo_t& lhs, const utxo_t& rhs) {
                     return cann::schema::token_amount_of(lhs) <
                            cann::schema::token_amount_of(rhs);
                   });
}

}  // namespace

utxo_locator::utxo_locator(const cann::schema::hash32_t& category)
    : category_{category} {}

bool utxo_locator::is_running_auction(const utxo_t& utxo) const {
  return cann::schema::has_category(utxo, category_) &&
         cann::schema::has_capability(utxo, token_capability_t::mutable_) &&
         cann::schema::token_amount_of(utxo) > 0;
}

registry_roles_t utxo_locator::classify_registry(
    const std::vector<utxo_t>& utxos,
    const cann::schema::locking_bytecode_t& thread_commitment,
    const std::optional<std::string_view> name) const {
  auto roles = registry_roles_t{};

  for (const auto& utxo : utxos) {
    if (!cann::schema::has_category(utxo, category_) || !utxo.token->nft) {
      continue;
    }
    const auto& commitment = utxo.token->nft->commitment;
    const auto amount = utxo.token->amount;

    switch (utxo.token->nft->capability) {
      case token_capability_t::none:
        if (!roles.thread && commitment == thread_commitment) {
          roles.thread = utxo;
        } else if (amount > 0) {
          roles.threads_with_token.push_back(utxo);
        }
        break;
      case token_capability_t::minting:
        if (amount > 0 && !commitment.empty()) {
          if (!roles.registration_counter) {
            roles.registration_counter = utxo;
          }
        } else if (amount == 0 && !roles.domain_minting) {
          roles.domain_minting = utxo;
        }
        break;
      case token_capability_t::mutable_:
        if (name && amount > 0 &&
            cann::protocol::name_from_auction_commitment(commitment) == *name) {
          roles.auctions.push_back(utxo);
        }
        break;
    }
  }

  sort_by_token_amount(roles.auctions);

  if (roles.thread) {
    spdlog::debug("located thread UTXO {}", describe(*roles.thread));
  }
  if (roles.registration_counter) {
    spdlog::debug("located registration counter UTXO {}",
                  describe(*roles.registration_counter));
  }
  return roles;
}

domain_roles_t utxo_locator::classify_domain(
    const std::vector<utxo_t>& utxos) const {
  auto roles = domain_roles_t{};
  for (const auto& utxo : utxos) {
    if (!cann::schema::has_category(utxo, category_)) {
      continue;
    }
    roles.holds_category = true;
    if (!cann::schema::has_capability(utxo, token_capability_t::none)) {
      continue;
    }
    if (utxo.token->nft->commitment.empty()) {
      if (!roles.external_auth) {
        roles.external_auth = utxo;
      }
    } else {
      roles.internal_auth.push_back(utxo);
    }
  }

  std::stable_sort(
      std::begin(roles.internal_auth), std::end(roles.internal_auth),
      [](const utxo_t& lhs, const utxo_t& rhs) {
        const auto& left = cann::schema::commitment_of(lhs);
        const auto& right = cann::schema::commitment_of(rhs);
        return std::lexicographical_compare(std::begin(left), std::end(left),
                                            std::begin(right),
                                            std::end(right));
      });
  return roles;
}

utxo_t utxo_locator::find_funding_utxo(
    const std::vector<utxo_t>& utxos,
    const cann::schema::satoshis_t required) const {
  const utxo_t* best = nullptr;
  for (const auto& utxo : utxos) {
    if (utxo.token) {
      continue;
    }
    if (best == nullptr || utxo.satoshis > best->satoshis) {
      best = &utxo;
    }
  }
  if (best == nullptr || best->satoshis < required) {
    cann::common::throw_not_found("FundingUTXO");
  }
  spdlog::debug("located funding UTXO {} ({} sats)", describe(*best),
                best->satoshis);
  return *best;
}

utxo_t utxo_locator::find_bidder_utxo(const std::vector<utxo_t>& utxos) const {
  const utxo_t* smallest = nullptr;
  for (const auto& utxo : utxos) {
    if (!utxo.token &&
        (smallest == nullptr || utxo.satoshis < smallest->satoshis)) {
      smallest = &utxo;
    }
  }
  if (smallest == nullptr) {
    cann::common::throw_not_found("BidderUTXO");
  }
  return *smallest;
}

utxo_t utxo_locator::find_authorized_contract_utxo(
    const std::vector<utxo_t>& utxos,
    const std::string_view covenant_name) const {
  if (utxos.empty()) {
    cann::common::throw_not_found(
        fmt::format("{}AuthorizedContractUTXO", covenant_name));
  }
  return utxos.front();
}

std::optional<utxo_t> utxo_locator::find_running_auction(
    const std::vector<utxo_t>& utxos,
    const std::string_view name) const {
  auto matches = std::vector<utxo_t>{};
  for (const auto& utxo : utxos) {
    if (is_running_auction(utxo) &&
        cann::protocol::name_from_auction_commitment(
            cann::schema::commitment_of(utxo)) == name) {
      matches.push_back(utxo);
    }
  }
  if (matches.empty()) {
    return std::nullopt;
  }
  sort_by_token_amount(matches);
  return matches.front();
}

std::vector<utxo_t> utxo_locator::find_running_auctions(
    const std::vector<utxo_t>& utxos) const {
  auto auctions = std::vector<utxo_t>{};
  std::copy_if(std::begin(utxos), std::end(utxos),
               std::back_inserter(auctions),
               [this](const utxo_t& utxo) { return is_running_auction(utxo); });
  return auctions;
}

std::optional<utxo_t> utxo_locator::find_ownership_utxo(
    const std::vector<utxo_t>& utxos,
    const std::string_view name) const {
  for (const auto& utxo : utxos) {
    if (cann::schema::has_category(utxo, category_) &&
        cann::schema::has_capability(utxo, token_capability_t::none) &&
        cann::protocol::name_from_ownership_commitment(
            cann::schema::commitment_of(utxo)) == name) {
      return utxo;
    }
  }
  return std::nullopt;
}

const utxo_t& require_role(const std::optional<utxo_t>& slot,
                           const std::string_view role) {
  if (!slot) {
    cann::common::throw_not_found(role);
  }
  return *slot;
}

}  // namespace cann::locator
