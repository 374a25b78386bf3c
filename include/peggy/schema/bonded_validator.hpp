#pragma once
#include <peggy/schema/primitives.hpp>

namespace peggy::schema {

template <uint16_t Version>
struct bonded_validator;

// Row of the staking module's bonded power table.
template <>
struct bonded_validator<1> final {
  native_address_t operator_address;
  uint64_t power{};
};

using bonded_validator_t = bonded_validator<1>;

}  // namespace peggy::schema
