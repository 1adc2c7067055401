#include <cann/crypto/hash.hpp>
#include <cann/protocol/records.hpp>
#include <cann/script/script.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace cann::protocol {

namespace {

std::string lowercase(std::string_view value) {
  auto out = std::string{value};
  std::transform(std::begin(out), std::end(out), std::begin(out),
                 [](const unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return out;
}

std::vector<std::string_view> split_key(std::string_view key) {
  auto segments = std::vector<std::string_view>{};
  while (!key.empty()) {
    auto dot = key.find('.');
    auto segment = key.substr(0, dot);
    if (!segment.empty()) {
      segments.push_back(segment);
    }
    if (dot == std::string_view::npos) {
      break;
    }
    key.remove_prefix(dot + 1);
  }
  return segments;
}

std::optional<uint64_t> parse_index(const std::string_view segment) {
  auto index = uint64_t{0};
  auto [end, ec] =
      std::from_chars(segment.data(), segment.data() + segment.size(), index);
  if (ec != std::errc{} || end != segment.data() + segment.size()) {
    return std::nullopt;
  }
  return index;
}

void fold_indexed_leaves(record_tree_t& node) {
  for (auto& [_, child] : node.children) {
    fold_indexed_leaves(child);
  }

  auto meta = node.children.find(std::string{kMetaKey});
  if (meta == std::end(node.children) || !meta->second.value) {
    return;
  }
  auto type = *meta->second.value;
  if (type != kMetaArray && type != kMetaText) {
    return;
  }

  auto indexed = std::map<uint64_t, std::string>{};
  for (auto it = std::begin(node.children); it != std::end(node.children);) {
    auto index = parse_index(it->first);
    if (!index || !it->second.value) {
      ++it;
      continue;
    }
    indexed[*index] = *it->second.value;
    it = node.children.erase(it);
  }
  node.children.erase(std::string{kMetaKey});

  if (type == kMetaArray) {
    for (auto& [_, item] : indexed) {
      node.items.push_back(std::move(item));
    }
    return;
  }

  auto text = std::string{};
  for (const auto& [_, item] : indexed) {
    if (!text.empty()) {
      text.push_back(' ');
    }
    text += item;
  }
  node.value = std::move(text);
}

// Hash named by a revocation marker, lowercased.
std::optional<std::string> revocation_target(const std::string_view record) {
  if (record.starts_with(kRevocationPrefix)) {
    return lowercase(record.substr(kRevocationPrefix.size()));
  }
  auto separator = record.find('=');
  if (separator != std::string_view::npos &&
      lowercase(record.substr(0, separator)) == kRevokedKey) {
    return lowercase(record.substr(separator + 1));
  }
  return std::nullopt;
}

std::string record_hash(const std::string_view record) {
  return cann::schema::to_hex(cann::crypto::sha256(record));
}

// Key a `meta` leaf governs: "ns.list" for "ns.list.3" and "ns.list".
std::string governed_key(const std::string_view record) {
  auto key = record.substr(0, record.find('='));
  auto dot = key.rfind('.');
  if (dot != std::string_view::npos && parse_index(key.substr(dot + 1))) {
    key = key.substr(0, dot);
  }
  return lowercase(key);
}

}  // namespace

std::string make_revocation_record(const std::string_view record) {
  return std::string{kRevocationPrefix} +
         cann::schema::to_hex(cann::crypto::sha256(record));
}

bool is_revocation_record(const std::string_view record) {
  return revocation_target(record).has_value();
}

std::vector<std::string> filter_valid_records(
    const std::vector<std::string>& records) {
  auto revoked = std::unordered_set<std::string>{};
  for (const auto& record : records) {
    if (auto target = revocation_target(record)) {
      revoked.insert(std::move(*target));
    }
  }

  // A revoked `key.meta` record takes the records it governs with it.
  auto suffix = "." + std::string{kMetaKey};
  auto revoked_meta = std::unordered_set<std::string>{};
  for (const auto& record : records) {
    auto key = governed_key(record);
    if (key.ends_with(suffix) && revoked.contains(record_hash(record))) {
      revoked_meta.insert(key.substr(0, key.size() - suffix.size()));
    }
  }

  auto valid = std::vector<std::string>{};
  for (const auto& record : records) {
    if (is_revocation_record(record) ||
        revoked.contains(record_hash(record)) ||
        (record.find('=') != std::string::npos &&
         revoked_meta.contains(governed_key(record)))) {
      continue;
    }
    valid.push_back(record);
  }
  return valid;
}

std::vector<std::string> deduplicate_records(
    const std::vector<std::string>& records) {
  auto seen = std::unordered_set<std::string>{};
  auto unique = std::vector<std::string>{};
  for (const auto& record : records) {
    if (seen.insert(record).second) {
      unique.push_back(record);
    }
  }
  return unique;
}

std::vector<std::string> extract_records_from_transaction(
    const cann::schema::transaction_t& tx) {
  auto records = std::vector<std::string>{};
  for (const auto& output : tx.outputs) {
    if (output.satoshis != 0) {
      continue;
    }
    auto payload =
        cann::script::try_extract_op_return_payload(output.locking_bytecode);
    if (!payload) {
      spdlog::debug("zero-value output is not a data carrier, skipping");
      continue;
    }
    records.push_back(cann::schema::make_string(*payload));
  }
  return records;
}

bool is_valid_candidate_transaction(
    const cann::schema::transaction_t& tx,
    const cann::schema::bytes_view_t& domain_locking_bytecode,
    const cann::schema::hash32_t& category) {
  auto has_data_output = false;
  auto returns_token_to_domain = false;
  for (const auto& output : tx.outputs) {
    if (output.satoshis == 0) {
      has_data_output = true;
      continue;
    }
    if (!output.token || output.token->category != category) {
      continue;
    }
    if (std::ranges::equal(output.locking_bytecode, domain_locking_bytecode)) {
      returns_token_to_domain = true;
    }
  }
  return has_data_output && returns_token_to_domain;
}

const record_tree_t* record_tree_t::find(const std::string_view path) const {
  const auto* node = this;
  for (const auto segment : split_key(path)) {
    auto it = node->children.find(std::string{segment});
    if (it == std::end(node->children)) {
      return nullptr;
    }
    node = &it->second;
  }
  return node;
}

record_tree_t parse_records(const std::vector<std::string>& records) {
  auto root = record_tree_t{};
  for (const auto& record : filter_valid_records(records)) {
    auto separator = record.find('=');
    if (separator == std::string::npos) {
      continue;
    }
    auto segments = split_key(std::string_view{record}.substr(0, separator));
    if (segments.empty()) {
      continue;
    }

    auto* node = &root.children[std::string{segments.front()}];
    for (auto i = size_t{1}; i < segments.size(); ++i) {
      node = &node->children[lowercase(segments[i])];
    }
    node->value = record.substr(separator + 1);
  }

  for (auto& [_, child] : root.children) {
    fold_indexed_leaves(child);
  }
  return root;
}

}  // namespace cann::protocol
