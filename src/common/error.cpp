#include <cann/common/error.hpp>

#include <fmt/format.h>

#include <utility>

namespace cann::common {

error::error(const error_code code, const std::string& message)
    : std::runtime_error{message}, code_{code} {}

error::error(const error_code code, const std::string& message,
             std::string role)
    : std::runtime_error{message}, code_{code}, role_{std::move(role)} {}

void throw_invalid_name(const std::string_view name) {
  throw error{error_code::invalid_name,
              fmt::format("invalid name '{}': only [A-Za-z0-9-] is allowed",
                          name)};
}

void throw_not_found(const std::string_view role) {
  throw error{error_code::not_found, fmt::format("{} not found", role),
              std::string{role}};
}

void throw_error(const error_code code, const std::string& message) {
  throw error{code, message};
}

}  // namespace cann::common
