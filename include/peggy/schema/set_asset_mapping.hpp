#pragma once
#include <peggy/schema/primitives.hpp>
#include <string>

namespace peggy::schema {

template <uint16_t Version>
struct set_asset_mapping;

template <>
struct set_asset_mapping<1> final {
  uint16_t version{1};
  std::string denom;
  eth_address_t erc20{};
  bool cosmos_originated{};
};

using set_asset_mapping_t = set_asset_mapping<1>;

}  // namespace peggy::schema
