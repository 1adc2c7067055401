#pragma once

#include <cann/config.hpp>
#include <cann/covenant/covenant_set.hpp>
#include <cann/protocol/records.hpp>
#include <cann/query/transport.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace cann::resolver {

struct records_t final {
  // Valid records in history order, revocations applied.
  std::vector<std::string> records;
  cann::protocol::record_tree_t tree;
};

class record_resolver final {
 public:
  record_resolver(const cann::config_t& config,
                  const cann::covenant::covenant_set& covenants,
                  cann::query::transport& transport);

  // Oldest first. Transactions that do not return a category token to the
  // domain covenant are ignored.
  std::vector<std::string> fetch_records(std::string_view name) const;

  records_t get_records(std::string_view name) const;

 private:
  const cann::config_t& config_;
  const cann::covenant::covenant_set& covenants_;
  cann::query::transport& transport_;
};

}  // namespace cann::resolver
