#pragma once

#include <cann/schema/primitives.hpp>

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace cann {

inline constexpr auto kDefaultFeePerByte = uint64_t{2};

// Addresses are locking bytecode. `inactivity_expiry_time` is carried for
// the domain covenants built outside the engine.
struct config_t final {
  cann::schema::hash32_t category{};
  cann::schema::satoshis_t min_starting_bid{};
  uint64_t min_bid_increase_percentage{};
  uint32_t inactivity_expiry_time{};
  // Relative timelock put on the auction input of a claim.
  uint32_t min_wait_time{};
  uint64_t max_platform_fee_percentage{};
  std::optional<cann::schema::locking_bytecode_t> creator_incentive_address;
  std::optional<cann::schema::locking_bytecode_t> platform_fee_address;
  std::string tld;
  // Selects the indexer for name resolution when set.
  std::optional<std::string> indexer_url;
  uint64_t fee_per_byte{kDefaultFeePerByte};
};

// INI style `key = value` file; configuration_error on missing or malformed
// keys.
config_t load_config(const std::filesystem::path& path);

config_t load_config(std::istream& stream);

}  // namespace cann
