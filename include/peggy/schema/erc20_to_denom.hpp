#pragma once
#include <peggy/schema/primitives.hpp>
#include <string>

namespace peggy::schema {

template <uint16_t Version>
struct erc20_to_denom;

template <>
struct erc20_to_denom<1> final {
  std::string denom;
  bool cosmos_originated{};
};

using erc20_to_denom_t = erc20_to_denom<1>;

}  // namespace peggy::schema
