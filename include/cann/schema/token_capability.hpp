#pragma once

#include <cann/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Mutability class of a non-fungible token. The numeric values are the low
// nibble of the CashTokens bitfield.
namespace cann::schema {

enum class token_capability_t : uint8_t { none = 0, mutable_ = 1, minting = 2 };

inline constexpr auto kTokenCapabilityNames = std::array{
    enum_name_t<token_capability_t>{"none", token_capability_t::none},
    enum_name_t<token_capability_t>{"mutable", token_capability_t::mutable_},
    enum_name_t<token_capability_t>{"minting", token_capability_t::minting}};

inline constexpr std::string_view to_string(const token_capability_t value) {
  return name_of(value, kTokenCapabilityNames);
}

}  // namespace cann::schema
