#pragma once
#include <peggy/schema/primitives.hpp>

// Schema type: bridge validator.
// Bridge workflow: one member of a valset. Power is the validator's share of
// bonded stake scaled onto [0, 2^32 - 1].
namespace peggy::schema {

template <uint16_t Version>
struct bridge_validator;

template <>
struct bridge_validator<1> final {
  uint32_t power{};
  eth_address_t ethereum_address{};
};

using bridge_validator_t = bridge_validator<1>;

}  // namespace peggy::schema
