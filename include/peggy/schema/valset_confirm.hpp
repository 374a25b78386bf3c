#pragma once
#include <peggy/schema/primitives.hpp>

// Schema type: valset confirm.
// Bridge workflow: an orchestrator's signature over the valset with `nonce`.
namespace peggy::schema {

template <uint16_t Version>
struct valset_confirm;

template <>
struct valset_confirm<1> final {
  uint64_t nonce{};
  native_address_t orchestrator;
  eth_address_t eth_address{};
  bytes_t signature;
};

using valset_confirm_t = valset_confirm<1>;

}  // namespace peggy::schema
