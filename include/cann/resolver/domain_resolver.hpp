#pragma once

#include <cann/config.hpp>
#include <cann/covenant/covenant_set.hpp>
#include <cann/locator/utxo_locator.hpp>
#include <cann/query/transport.hpp>
#include <cann/schema/domain_status.hpp>
#include <cann/schema/utxo.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cann::resolver {

struct auction_info_t final {
  std::string name;
  cann::schema::registration_id_t registration_id{};
  cann::schema::satoshis_t current_bid{};
  cann::schema::hash20_t bidder{};
  cann::schema::utxo_t utxo;
};

struct domain_info_t final {
  std::string name;
  cann::covenant::covenant_t covenant;
  cann::schema::domain_status_t status{cann::schema::domain_status_t::invalid};
  // UTXOs at the domain covenant.
  std::vector<cann::schema::utxo_t> utxos;
  std::optional<auction_info_t> auction;
};

struct past_auction_t final {
  std::string name;
  cann::schema::satoshis_t final_amount{};
  cann::schema::hash32_t txid{};
  int64_t height{};
};

std::optional<auction_info_t> make_auction_info(
    const cann::schema::utxo_t& utxo);

// Classifies names and lists auctions from the registry's token state.
class domain_resolver final {
 public:
  domain_resolver(const cann::config_t& config,
                  const cann::covenant::covenant_set& covenants,
                  cann::query::transport& transport);

  // Registered beats auctioning beats available/invalid.
  domain_info_t get_domain(std::string_view name) const;

  std::vector<auction_info_t> get_active_auctions() const;

  // Read from the domain factory's claim transactions.
  std::vector<past_auction_t> get_past_auctions() const;

 private:
  const cann::config_t& config_;
  const cann::covenant::covenant_set& covenants_;
  cann::query::transport& transport_;
  cann::locator::utxo_locator locator_;
};

}  // namespace cann::resolver
