#pragma once

#include <cann/schema/primitives.hpp>
#include <cann/schema/utxo.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace cann::locator {

struct registry_roles_t final {
  std::optional<cann::schema::utxo_t> thread;
  std::optional<cann::schema::utxo_t> registration_counter;
  std::optional<cann::schema::utxo_t> domain_minting;
  // Other threads holding a fungible amount, in UTXO order.
  std::vector<cann::schema::utxo_t> threads_with_token;
  // Running auctions for the requested name, earliest registration first.
  std::vector<cann::schema::utxo_t> auctions;
};

struct domain_roles_t final {
  // Lowest registration id first.
  std::vector<cann::schema::utxo_t> internal_auth;
  std::optional<cann::schema::utxo_t> external_auth;
  bool holds_category{};
};

// Roles are recognised by category, capability and commitment shape, never
// by outpoint.
class utxo_locator final {
 public:
  explicit utxo_locator(const cann::schema::hash32_t& category);

  // `thread_commitment` is the locking bytecode of the covenant whose thread
  // is wanted.
  registry_roles_t classify_registry(
      const std::vector<cann::schema::utxo_t>& utxos,
      const cann::schema::locking_bytecode_t& thread_commitment,
      std::optional<std::string_view> name = std::nullopt) const;

  domain_roles_t classify_domain(
      const std::vector<cann::schema::utxo_t>& utxos) const;

  // Largest token-free coin holding at least `required`.
  cann::schema::utxo_t find_funding_utxo(
      const std::vector<cann::schema::utxo_t>& utxos,
      cann::schema::satoshis_t required = 0) const;

  // Smallest token-free coin.
  cann::schema::utxo_t find_bidder_utxo(
      const std::vector<cann::schema::utxo_t>& utxos) const;

  cann::schema::utxo_t find_authorized_contract_utxo(
      const std::vector<cann::schema::utxo_t>& utxos,
      std::string_view covenant_name) const;

  std::optional<cann::schema::utxo_t> find_running_auction(
      const std::vector<cann::schema::utxo_t>& utxos,
      std::string_view name) const;

  std::vector<cann::schema::utxo_t> find_running_auctions(
      const std::vector<cann::schema::utxo_t>& utxos) const;

  std::optional<cann::schema::utxo_t> find_ownership_utxo(
      const std::vector<cann::schema::utxo_t>& utxos,
      std::string_view name) const;

  const cann::schema::hash32_t& category() const { return category_; }

 private:
  bool is_running_auction(const cann::schema::utxo_t& utxo) const;

  cann::schema::hash32_t category_;
};

const cann::schema::utxo_t& require_role(
    const std::optional<cann::schema::utxo_t>& slot,
    std::string_view role);

}  // namespace cann::locator
