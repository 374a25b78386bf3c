#pragma once
#include <peggy/schema/bridge_validator.hpp>
#include <peggy/schema/primitives.hpp>
#include <vector>

// Schema type: valset.
// Bridge workflow: immutable snapshot of bridge eligible validators taken at
// `height`. Members are ordered by power descending, then address ascending.
namespace peggy::schema {

template <uint16_t Version>
struct valset;

template <>
struct valset<1> final {
  uint64_t nonce{};
  uint64_t height{};
  std::vector<bridge_validator_t> members;
};

using valset_t = valset<1>;

}  // namespace peggy::schema
