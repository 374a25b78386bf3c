#pragma once
#include <peggy/schema/outgoing_transfer_tx.hpp>
#include <peggy/schema/primitives.hpp>
#include <vector>

// Schema type: outgoing tx batch.
// Bridge workflow: bounded group of transfers for one token contract, stamped
// with a module wide batch nonce. Immutable once created.
namespace peggy::schema {

template <uint16_t Version>
struct outgoing_tx_batch;

template <>
struct outgoing_tx_batch<1> final {
  uint64_t batch_nonce{};
  uint64_t block{};
  eth_address_t token_contract{};
  std::vector<outgoing_transfer_tx_t> transactions;
};

using outgoing_tx_batch_t = outgoing_tx_batch<1>;

}  // namespace peggy::schema
