#pragma once

#include <cann/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Status of a name at a given ledger snapshot. Registered takes precedence
// over auctioning, which takes precedence over available/invalid.
namespace cann::schema {

enum class domain_status_t : uint8_t {
  available = 0,
  auctioning = 1,
  registered = 2,
  invalid = 3
};

inline constexpr auto kDomainStatusNames = std::array{
    enum_name_t<domain_status_t>{"AVAILABLE", domain_status_t::available},
    enum_name_t<domain_status_t>{"AUCTIONING", domain_status_t::auctioning},
    enum_name_t<domain_status_t>{"REGISTERED", domain_status_t::registered},
    enum_name_t<domain_status_t>{"INVALID", domain_status_t::invalid}};

inline constexpr std::string_view to_string(const domain_status_t value) {
  return name_of(value, kDomainStatusNames);
}

}  // namespace cann::schema
