#pragma once
#include <peggy/schema/primitives.hpp>
#include <string>

// Schema type: asset mapping.
// Bridge workflow: pairs a native denom with its Ethereum token contract.
// `cosmos_originated` is true when the native chain issues the asset.
namespace peggy::schema {

template <uint16_t Version>
struct asset_mapping;

template <>
struct asset_mapping<1> final {
  std::string denom;
  eth_address_t erc20{};
  bool cosmos_originated{};
};

using asset_mapping_t = asset_mapping<1>;

}  // namespace peggy::schema
