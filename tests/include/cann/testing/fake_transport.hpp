#pragma once

#include <cann/crypto/hash.hpp>
#include <cann/query/transport.hpp>
#include <cann/schema/encoding/bch/encoder.hpp>
#include <cann/schema/transaction.hpp>

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace cann::testing {

// In-memory ledger view. Every call may come from a different thread.
class fake_transport final : public cann::query::transport {
 public:
  std::vector<cann::schema::utxo_t> get_utxos(
      const cann::schema::locking_bytecode_t& locking_bytecode) override {
    ++utxo_queries_;
    auto lock = std::scoped_lock{mutex_};
    auto it = utxos_.find(locking_bytecode);
    return it == std::end(utxos_) ? std::vector<cann::schema::utxo_t>{}
                                  : it->second;
  }

  cann::schema::bytes_t get_raw_transaction(
      const cann::schema::hash32_t& txid) override {
    auto lock = std::scoped_lock{mutex_};
    auto it = raw_.find(txid);
    if (it == std::end(raw_)) {
      throw std::runtime_error{"unknown transaction"};
    }
    return it->second;
  }

  std::vector<cann::schema::history_entry_t> fetch_history(
      const cann::schema::locking_bytecode_t& locking_bytecode) override {
    auto lock = std::scoped_lock{mutex_};
    auto it = history_.find(locking_bytecode);
    return it == std::end(history_)
               ? std::vector<cann::schema::history_entry_t>{}
               : it->second;
  }

  void add_utxo(const cann::schema::utxo_t& utxo) {
    auto lock = std::scoped_lock{mutex_};
    utxos_[utxo.locking_bytecode].push_back(utxo);
  }

  void add_utxos(const std::vector<cann::schema::utxo_t>& utxos) {
    for (const auto& utxo : utxos) {
      add_utxo(utxo);
    }
  }

  void remove_utxos(const cann::schema::locking_bytecode_t& locking_bytecode) {
    auto lock = std::scoped_lock{mutex_};
    utxos_.erase(locking_bytecode);
  }

  void add_raw_transaction(const cann::schema::hash32_t& txid,
                           cann::schema::bytes_t raw) {
    auto lock = std::scoped_lock{mutex_};
    raw_[txid] = std::move(raw);
  }

  void add_history(const cann::schema::locking_bytecode_t& locking_bytecode,
                   const cann::schema::hash32_t& txid, const int64_t height) {
    auto lock = std::scoped_lock{mutex_};
    auto& entries = history_[locking_bytecode];
    auto known = std::any_of(std::begin(entries), std::end(entries),
                             [&](const auto& entry) { return entry.txid == txid; });
    if (!known) {
      entries.push_back(
          cann::schema::history_entry_t{.txid = txid, .height = height});
    }
  }

  // Returns the display-order txid.
  cann::schema::hash32_t add_transaction(
      const cann::schema::transaction_t& tx, const int64_t height,
      const std::vector<cann::schema::locking_bytecode_t>& spent_from = {}) {
    auto encoder = cann::schema::encoding::encoder<
        cann::schema::encoding::bch_encoder_tag>{};
    auto raw = encoder.encode(tx);
    auto txid = cann::schema::reverse_hash(cann::crypto::hash256(raw));
    add_raw_transaction(txid, std::move(raw));
    for (const auto& output : tx.outputs) {
      add_history(output.locking_bytecode, txid, height);
    }
    for (const auto& locking_bytecode : spent_from) {
      add_history(locking_bytecode, txid, height);
    }
    return txid;
  }

  // Spends the referenced UTXOs and lists the new ones.
  cann::schema::hash32_t apply_transaction(const cann::schema::transaction_t& tx,
                                           const int64_t height) {
    auto spent_from = std::vector<cann::schema::locking_bytecode_t>{};
    {
      auto lock = std::scoped_lock{mutex_};
      for (const auto& input : tx.inputs) {
        for (auto& [locking_bytecode, utxos] : utxos_) {
          auto it = std::find_if(std::begin(utxos), std::end(utxos),
                                 [&](const auto& utxo) {
                                   return utxo.outpoint == input.outpoint;
                                 });
          if (it != std::end(utxos)) {
            spent_from.push_back(locking_bytecode);
            utxos.erase(it);
            break;
          }
        }
      }
    }

    auto txid = add_transaction(tx, height, spent_from);
    for (size_t i = 0; i < tx.outputs.size(); ++i) {
      const auto& output = tx.outputs[i];
      if (output.satoshis == 0 && !output.token) {
        continue;
      }
      add_utxo(cann::schema::utxo_t{
          .outpoint = cann::schema::outpoint_t{
              .txid = txid, .index = static_cast<uint32_t>(i)},
          .satoshis = output.satoshis,
          .token = output.token,
          .locking_bytecode = output.locking_bytecode,
          .height = height > 0 ? std::optional<uint64_t>{static_cast<uint64_t>(
                                     height)}
                               : std::nullopt});
    }
    return txid;
  }

  size_t utxo_queries() const { return utxo_queries_.load(); }

 private:
  std::mutex mutex_;
  std::atomic<size_t> utxo_queries_{0};
  std::map<cann::schema::locking_bytecode_t, std::vector<cann::schema::utxo_t>>
      utxos_;
  std::map<cann::schema::hash32_t, cann::schema::bytes_t> raw_;
  std::map<cann::schema::locking_bytecode_t,
           std::vector<cann::schema::history_entry_t>>
      history_;
};

}  // namespace cann::testing
