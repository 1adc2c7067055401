#include <cann/common/error.hpp>
#include <cann/protocol/name.hpp>

#include <algorithm>

namespace cann::protocol {

bool is_valid_name_character(const char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '-';
}

bool is_valid_name(const std::string_view name) {
  return !name.empty() &&
         std::all_of(std::begin(name), std::end(name), is_valid_name_character);
}

void validate_name(const std::string_view name) {
  if (!is_valid_name(name)) {
    cann::common::throw_invalid_name(name);
  }
}

int64_t find_first_invalid_character_index(const std::string_view name) {
  auto it = std::find_if_not(std::begin(name), std::end(name),
                             is_valid_name_character);
  if (it == std::end(name)) {
    return kNoInvalidCharacter;
  }
  return static_cast<int64_t>(std::distance(std::begin(name), it)) + 1;
}

cann::schema::bytes_t name_to_bytes(const std::string_view name) {
  return cann::schema::make_bytes(name);
}

}  // namespace cann::protocol
