#pragma once
#include <cann/schema/primitives.hpp>
#include <string_view>

namespace cann::crypto {

cann::schema::hash32_t sha256(const cann::schema::bytes_view_t& bytes);
cann::schema::hash32_t sha256(const std::string_view& str);

// Double SHA-256, used for transaction ids and P2SH32 script hashes.
cann::schema::hash32_t hash256(const cann::schema::bytes_view_t& bytes);

}  // namespace cann::crypto
