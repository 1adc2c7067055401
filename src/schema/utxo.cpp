#include <cann/schema/transaction.hpp>
#include <cann/schema/utxo.hpp>

namespace cann::schema {

namespace {

const auto kEmptyCommitment = bytes_t{};

}  // namespace

bool has_category(const utxo_t& utxo, const hash32_t& category) {
  return utxo.token.has_value() && utxo.token->category == category;
}

bool has_capability(const utxo_t& utxo, const token_capability_t capability) {
  return utxo.token.has_value() && utxo.token->nft.has_value() &&
         utxo.token->nft->capability == capability;
}

const bytes_t& commitment_of(const utxo_t& utxo) {
  if (!utxo.token || !utxo.token->nft) {
    return kEmptyCommitment;
  }
  return utxo.token->nft->commitment;
}

token_amount_t token_amount_of(const utxo_t& utxo) {
  return utxo.token ? utxo.token->amount : token_amount_t{0};
}

output_t make_source_output(const utxo_t& utxo) {
  return output_t{.locking_bytecode = utxo.locking_bytecode,
                  .satoshis = utxo.satoshis,
                  .token = utxo.token};
}

}  // namespace cann::schema
