#pragma once

#include <cann/schema/primitives.hpp>
#include <cann/schema/utxo.hpp>

#include <vector>

namespace cann::query {

// Ledger queries (Electrum/Fulcrum in production). Called from several
// threads at once; failures throw and are not retried.
class transport {
 public:
  virtual ~transport() = default;

  virtual std::vector<cann::schema::utxo_t> get_utxos(
      const cann::schema::locking_bytecode_t& locking_bytecode) = 0;

  // `txid` in display order.
  virtual cann::schema::bytes_t get_raw_transaction(
      const cann::schema::hash32_t& txid) = 0;

  virtual std::vector<cann::schema::history_entry_t> fetch_history(
      const cann::schema::locking_bytecode_t& locking_bytecode) = 0;
};

}  // namespace cann::query
