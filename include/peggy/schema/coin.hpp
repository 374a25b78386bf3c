#pragma once
#include <peggy/schema/primitives.hpp>
#include <string>

namespace peggy::schema {

template <uint16_t Version>
struct coin;

template <>
struct coin<1> final {
  std::string denom;
  amount_t amount{};
};

using coin_t = coin<1>;

}  // namespace peggy::schema
