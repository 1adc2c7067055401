#pragma once

#include <cann/schema/primitives.hpp>

#include <string>
#include <vector>

// Per-operation inputs of the transaction assembler. Payer, bidder and
// owner locking bytecode must be P2PKH where the protocol writes the
// public key hash into a commitment.
namespace cann::assembler {

struct accumulate_params_t final {
  cann::schema::locking_bytecode_t payer;
};

struct auction_params_t final {
  std::string name;
  cann::schema::satoshis_t amount{};
  cann::schema::locking_bytecode_t payer;
};

struct bid_params_t final {
  std::string name;
  cann::schema::satoshis_t amount{};
  cann::schema::locking_bytecode_t bidder;
};

// The winning bidder is read from the auction commitment.
struct claim_domain_params_t final {
  std::string name;
};

struct records_params_t final {
  std::string name;
  std::vector<std::string> records;
  cann::schema::locking_bytecode_t owner;
};

struct penalty_params_t final {
  std::string name;
  cann::schema::locking_bytecode_t reward_to;
};

}  // namespace cann::assembler
