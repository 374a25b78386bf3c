#pragma once
#include <peggy/schema/erc20_token.hpp>
#include <peggy/schema/primitives.hpp>
#include <vector>

// Schema type: outgoing logic call.
// Bridge workflow: one shot contract call executed by the Ethereum bridge.
// (invalidation_id, invalidation_nonce) is the replay protection key.
namespace peggy::schema {

template <uint16_t Version>
struct outgoing_logic_call;

template <>
struct outgoing_logic_call<1> final {
  std::vector<erc20_token_t> transfers;
  std::vector<erc20_token_t> fees;
  eth_address_t logic_contract_address{};
  bytes_t payload;
  uint64_t timeout{};
  bytes_t invalidation_id;
  uint64_t invalidation_nonce{};
};

using outgoing_logic_call_t = outgoing_logic_call<1>;

}  // namespace peggy::schema
