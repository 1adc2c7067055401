#include <cann/protocol/name.hpp>
#include <cann/resolver/history.hpp>
#include <cann/resolver/record_resolver.hpp>

#include <spdlog/spdlog.h>

#include <iterator>

namespace cann::resolver {

record_resolver::record_resolver(const cann::config_t& config,
                                 const cann::covenant::covenant_set& covenants,
                                 cann::query::transport& transport)
    : config_{config}, covenants_{covenants}, transport_{transport} {}

std::vector<std::string> record_resolver::fetch_records(
    const std::string_view name) const {
  cann::protocol::validate_name(name);
  auto domain = covenants_.domain(name);
  auto history = transport_.fetch_history(domain.locking_bytecode);

  auto collected = std::vector<std::string>{};
  for (const auto& [entry, tx] : fetch_transactions(transport_, history)) {
    if (!cann::protocol::is_valid_candidate_transaction(
            tx, domain.locking_bytecode, config_.category)) {
      continue;
    }
    auto records = cann::protocol::extract_records_from_transaction(tx);
    collected.insert(std::end(collected),
                     std::make_move_iterator(std::begin(records)),
                     std::make_move_iterator(std::end(records)));
  }

  auto valid = cann::protocol::filter_valid_records(
      cann::protocol::deduplicate_records(collected));
  spdlog::debug("{} of {} records of '{}' are valid", valid.size(),
                collected.size(), name);
  return valid;
}

records_t record_resolver::get_records(const std::string_view name) const {
  auto records = fetch_records(name);
  auto tree = cann::protocol::parse_records(records);
  return records_t{.records = std::move(records), .tree = std::move(tree)};
}

}  // namespace cann::resolver
