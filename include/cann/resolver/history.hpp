#pragma once

#include <cann/query/transport.hpp>
#include <cann/schema/transaction.hpp>
#include <cann/schema/utxo.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace cann::resolver {

// Upper bound on raw transaction requests in flight at once.
inline constexpr auto kHistoryFetchWindow = size_t{16};

struct history_transaction_t final {
  cann::schema::history_entry_t entry;
  cann::schema::transaction_t transaction;
};

// Undecodable transactions are skipped; transport failures propagate.
// Keeps history order.
std::vector<history_transaction_t> fetch_transactions(
    cann::query::transport& transport,
    const std::vector<cann::schema::history_entry_t>& history);

std::optional<cann::schema::transaction_t> fetch_transaction(
    cann::query::transport& transport,
    const cann::schema::hash32_t& txid);

}  // namespace cann::resolver
