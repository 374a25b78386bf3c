#pragma once
#include <peggy/schema/primitives.hpp>

// Schema type: erc20 token.
// Bridge workflow: amount of a specific Ethereum token contract, used for
// transfer amounts, bridge fees and logic call transfers.
namespace peggy::schema {

template <uint16_t Version>
struct erc20_token;

template <>
struct erc20_token<1> final {
  eth_address_t contract{};
  amount_t amount{};
};

using erc20_token_t = erc20_token<1>;

}  // namespace peggy::schema
