#pragma once
#include <peggy/schema/outgoing_transfer_tx.hpp>
#include <vector>

// Schema type: pending send to eth.
// Bridge workflow: a sender's outstanding transfers split by whether a batch
// has already picked them up.
namespace peggy::schema {

template <uint16_t Version>
struct pending_send_to_eth;

template <>
struct pending_send_to_eth<1> final {
  std::vector<outgoing_transfer_tx_t> transfers_in_batches;
  std::vector<outgoing_transfer_tx_t> unbatched_transfers;
};

using pending_send_to_eth_t = pending_send_to_eth<1>;

}  // namespace peggy::schema
