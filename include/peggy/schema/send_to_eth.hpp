#pragma once
#include <peggy/schema/coin.hpp>
#include <peggy/schema/primitives.hpp>

// Schema type: send to eth.
// Bridge workflow: escrows amount + bridge_fee from the sender and queues an
// outgoing transfer. Both coins must share one denom.
namespace peggy::schema {

template <uint16_t Version>
struct send_to_eth;

template <>
struct send_to_eth<1> final {
  uint16_t version{1};
  native_address_t sender;
  eth_address_t eth_dest{};
  coin_t amount;
  coin_t bridge_fee;
};

using send_to_eth_t = send_to_eth<1>;

}  // namespace peggy::schema
