#pragma once
#include <peggy/schema/primitives.hpp>
#include <string>

namespace peggy::schema {

template <uint16_t Version>
struct request_batch;

template <>
struct request_batch<1> final {
  uint16_t version{1};
  native_address_t requester;
  std::string denom;
};

using request_batch_t = request_batch<1>;

}  // namespace peggy::schema
