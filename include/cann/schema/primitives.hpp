#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cann::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using hash20_t = std::array<uint8_t, 20>;

// Locking bytecode stands in for an address everywhere in the engine.
using locking_bytecode_t = bytes_t;
using satoshis_t = uint64_t;
using token_amount_t = uint64_t;
using registration_id_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

// Transaction ids and token categories are written in display order (the
// reverse of their serialized order).
hash32_t reverse_hash(const hash32_t& hash);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);

bool starts_with(const bytes_view_t& bytes, const bytes_view_t& prefix);

}  // namespace cann::schema
