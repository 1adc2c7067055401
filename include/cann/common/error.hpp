#pragma once

#include <cann/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cann::common {

enum class error_code : uint32_t {
  invalid_name = 1,
  not_found = 2,
  insufficient_bid = 3,
  configuration_error = 4,
  insufficient_funds = 5,
  invalid_argument = 6,
  decode_failure = 7,
};

using error_code_name_t = cann::schema::enum_name_t<error_code>;

inline constexpr auto kErrorCodeNames = std::array{
    error_code_name_t{"invalid_name", error_code::invalid_name},
    error_code_name_t{"not_found", error_code::not_found},
    error_code_name_t{"insufficient_bid", error_code::insufficient_bid},
    error_code_name_t{"configuration_error", error_code::configuration_error},
    error_code_name_t{"insufficient_funds", error_code::insufficient_funds},
    error_code_name_t{"invalid_argument", error_code::invalid_argument},
    error_code_name_t{"decode_failure", error_code::decode_failure}};

inline constexpr std::string_view to_string(const error_code value) {
  return cann::schema::name_of(value, kErrorCodeNames);
}

// `role()` names the missing UTXO role of a not_found, e.g. "ThreadUTXO".
class error final : public std::runtime_error {
 public:
  error(error_code code, const std::string& message);
  error(error_code code, const std::string& message, std::string role);

  error_code code() const noexcept { return code_; }
  const std::optional<std::string>& role() const noexcept { return role_; }

 private:
  error_code code_;
  std::optional<std::string> role_;
};

[[noreturn]] void throw_invalid_name(std::string_view name);
[[noreturn]] void throw_not_found(std::string_view role);
[[noreturn]] void throw_error(error_code code, const std::string& message);

}  // namespace cann::common
