#pragma once

#include <cann/schema/primitives.hpp>
#include <cann/schema/transaction.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cann::protocol {

inline constexpr auto kRevocationPrefix = std::string_view{"RMV "};
// `revoked=<hex sha256>` is the key/value form of the same marker.
inline constexpr auto kRevokedKey = std::string_view{"revoked"};
inline constexpr auto kMetaKey = std::string_view{"meta"};
inline constexpr auto kMetaArray = std::string_view{"type:array"};
inline constexpr auto kMetaText = std::string_view{"type:text"};

/// "RMV " followed by the hex SHA-256 of the record's UTF-8 bytes.
std::string make_revocation_record(std::string_view record);

/// `RMV <hash>` or `revoked=<hash>`, key and hash matched case-insensitively.
bool is_revocation_record(std::string_view record);

/// Drops revocation markers and every record a marker in the same set
/// refers to. Revoking a `key.meta` record also drops `key` and its numeric
/// siblings `key.<n>`. Revocation is by content hash, so the position of
/// the marker does not matter. Survivors keep their relative order.
std::vector<std::string> filter_valid_records(
    const std::vector<std::string>& records);

/// Keeps the first occurrence of each record.
std::vector<std::string> deduplicate_records(
    const std::vector<std::string>& records);

/// UTF-8 payload of every zero-value OP_RETURN output, in output order.
std::vector<std::string> extract_records_from_transaction(
    const cann::schema::transaction_t& tx);

/// A transaction carries records for a domain when it has a zero-value
/// output and returns a `category` token to the domain's locking bytecode.
bool is_valid_candidate_transaction(
    const cann::schema::transaction_t& tx,
    const cann::schema::bytes_view_t& domain_locking_bytecode,
    const cann::schema::hash32_t& category);

struct record_tree_t final {
  std::optional<std::string> value;
  // Folded numeric leaves of a `meta=type:array` node.
  std::vector<std::string> items;
  std::map<std::string, record_tree_t> children;

  // Dotted path lookup, e.g. find("social.twitter").
  const record_tree_t* find(std::string_view path) const;
};

/// Builds the key-path tree for `key.sub=value` records after
/// `filter_valid_records`.
///
/// Segments after the first are lowercased. A `meta` leaf set to
/// `type:array` turns the numeric siblings into `items` (index order), and
/// `type:text` joins them with spaces into `value`; the meta leaf and the
/// numeric leaves are then removed.
record_tree_t parse_records(const std::vector<std::string>& records);

}  // namespace cann::protocol
