#pragma once
#include <peggy/schema/primitives.hpp>

namespace peggy::schema {

template <uint16_t Version>
struct request_valset;

template <>
struct request_valset<1> final {
  uint16_t version{1};
  native_address_t requester;
};

using request_valset_t = request_valset<1>;

}  // namespace peggy::schema
