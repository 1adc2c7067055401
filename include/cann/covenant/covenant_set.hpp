#pragma once

#include <cann/schema/enum_string.hpp>
#include <cann/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <string_view>
#include <variant>

namespace cann::covenant {

enum class covenant_role_t : uint8_t {
  registry = 0,
  auction = 1,
  bid = 2,
  domain_factory = 3,
  accumulator = 4,
  auction_conflict_resolver = 5,
  auction_name_enforcer = 6,
  domain_ownership_guard = 7,
  domain = 8
};

using covenant_name_t = cann::schema::enum_name_t<covenant_role_t>;

inline constexpr auto kCovenantRoleNames = std::array{
    covenant_name_t{"Registry", covenant_role_t::registry},
    covenant_name_t{"Auction", covenant_role_t::auction},
    covenant_name_t{"Bid", covenant_role_t::bid},
    covenant_name_t{"DomainFactory", covenant_role_t::domain_factory},
    covenant_name_t{"Accumulator", covenant_role_t::accumulator},
    covenant_name_t{"AuctionConflictResolver",
                    covenant_role_t::auction_conflict_resolver},
    covenant_name_t{"AuctionNameEnforcer",
                    covenant_role_t::auction_name_enforcer},
    covenant_name_t{"DomainOwnershipGuard",
                    covenant_role_t::domain_ownership_guard},
    covenant_name_t{"Domain", covenant_role_t::domain}};

inline constexpr std::string_view to_string(const covenant_role_t value) {
  return cann::schema::name_of(value, kCovenantRoleNames);
}

// Arguments of the covenant functions the engine spends through.
struct call_with_name_t final {
  cann::schema::bytes_t name;  // Auction
};
struct call_with_index_t final {
  int64_t invalid_character_index{};  // AuctionNameEnforcer
};
struct use_auth_t final {
  uint8_t auth_index{};  // Domain: 0 external, 1 internal
};
// Registry thread spends and every other guard, factory or accumulator call.
struct call_t final {};

using unlock_request_t =
    std::variant<call_t, call_with_name_t, call_with_index_t, use_auth_t>;

// Produces the unlocking bytecode for one input spending a covenant coin.
using unlock_builder_t =
    std::function<cann::schema::bytes_t(const unlock_request_t& request)>;

struct covenant_t final {
  covenant_role_t role{covenant_role_t::registry};
  cann::schema::locking_bytecode_t locking_bytecode;
  unlock_builder_t unlock;
};

// Deployed covenants of one registry. Script compilation lives behind it.
class covenant_set {
 public:
  virtual ~covenant_set() = default;

  // Not for `covenant_role_t::domain`; use `domain(name)`.
  virtual const covenant_t& get(covenant_role_t role) const = 0;

  virtual covenant_t domain(std::string_view name) const = 0;
};

}  // namespace cann::covenant
