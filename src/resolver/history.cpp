#include <cann/resolver/history.hpp>
#include <cann/schema/encoding/bch/encoder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>

namespace cann::resolver {

namespace {

using encoder_t = cann::schema::encoding::encoder<
    cann::schema::encoding::bch_encoder_tag>;

}  // namespace

std::optional<cann::schema::transaction_t> fetch_transaction(
    cann::query::transport& transport,
    const cann::schema::hash32_t& txid) {
  auto raw = transport.get_raw_transaction(txid);
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<cann::schema::transaction_t>(raw);
  if (!decoded) {
    spdlog::warn("skipping undecodable transaction {}",
                 cann::schema::to_hex(txid));
  }
  return decoded;
}

std::vector<history_transaction_t> fetch_transactions(
    cann::query::transport& transport,
    const std::vector<cann::schema::history_entry_t>& history) {
  auto transactions = std::vector<history_transaction_t>{};
  auto pending =
      std::vector<std::future<std::optional<cann::schema::transaction_t>>>{};
  pending.reserve(std::min(history.size(), kHistoryFetchWindow));

  for (size_t begin = 0; begin < history.size();
       begin += kHistoryFetchWindow) {
    auto end = std::min(history.size(), begin + kHistoryFetchWindow);
    pending.clear();
    for (auto i = begin; i < end; ++i) {
      pending.push_back(
          std::async(std::launch::async, [&transport, &entry = history[i]] {
            return fetch_transaction(transport, entry.txid);
          }));
    }
    // Every future of the window is joined before a transport failure
    // propagates.
    for (auto& future : pending) {
      future.wait();
    }
    for (auto i = begin; i < end; ++i) {
      auto decoded = pending[i - begin].get();
      if (decoded) {
        transactions.push_back(history_transaction_t{
            .entry = history[i], .transaction = std::move(*decoded)});
      }
    }
  }
  return transactions;
}

}  // namespace cann::resolver
