#pragma once
#include <peggy/schema/primitives.hpp>

namespace peggy::schema {

template <uint16_t Version>
struct denom_to_erc20;

template <>
struct denom_to_erc20<1> final {
  eth_address_t erc20{};
  bool cosmos_originated{};
};

using denom_to_erc20_t = denom_to_erc20<1>;

}  // namespace peggy::schema
