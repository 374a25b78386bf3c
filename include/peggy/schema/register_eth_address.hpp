#pragma once
#include <peggy/schema/primitives.hpp>

namespace peggy::schema {

template <uint16_t Version>
struct register_eth_address;

template <>
struct register_eth_address<1> final {
  uint16_t version{1};
  native_address_t validator;
  eth_address_t eth_address{};
};

using register_eth_address_t = register_eth_address<1>;

}  // namespace peggy::schema
