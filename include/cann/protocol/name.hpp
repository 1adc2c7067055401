#pragma once

#include <cann/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

namespace cann::protocol {

inline constexpr auto kNoInvalidCharacter = int64_t{-1};

bool is_valid_name_character(char c);

// True when `name` is non-empty and made of [A-Za-z0-9-] only.
bool is_valid_name(std::string_view name);

void validate_name(std::string_view name);

// 1-based, or kNoInvalidCharacter. The name enforcer covenant takes this
// index as proof that an auctioned name is malformed.
int64_t find_first_invalid_character_index(std::string_view name);

cann::schema::bytes_t name_to_bytes(std::string_view name);

}  // namespace cann::protocol
