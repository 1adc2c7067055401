#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace cann::schema {

template <typename Enum>
struct enum_name_t final {
  std::string_view name;
  Enum value;
};

// Label of `value` in `names`, "unknown" for values missing from the table.
template <typename Enum, std::size_t N>
constexpr std::string_view name_of(
    const Enum value, const std::array<enum_name_t<Enum>, N>& names) {
  for (const auto& entry : names) {
    if (entry.value == value) {
      return entry.name;
    }
  }
  return "unknown";
}

}  // namespace cann::schema
