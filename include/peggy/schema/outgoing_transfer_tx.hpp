#pragma once
#include <peggy/schema/erc20_token.hpp>
#include <peggy/schema/primitives.hpp>

// Schema type: outgoing transfer tx.
// Bridge workflow: user request to move tokens to Ethereum. Sits in the
// outgoing pool until a batch picks it up.
namespace peggy::schema {

template <uint16_t Version>
struct outgoing_transfer_tx;

template <>
struct outgoing_transfer_tx<1> final {
  uint64_t id{};
  native_address_t sender;
  eth_address_t dest_address{};
  erc20_token_t erc20_token;
  erc20_token_t erc20_fee;
};

using outgoing_transfer_tx_t = outgoing_transfer_tx<1>;

}  // namespace peggy::schema
