#pragma once
#include <peggy/schema/primitives.hpp>

namespace peggy::schema {

template <uint16_t Version>
struct batch_confirm;

template <>
struct batch_confirm<1> final {
  uint64_t nonce{};
  eth_address_t token_contract{};
  native_address_t orchestrator;
  eth_address_t eth_signer{};
  bytes_t signature;
};

using batch_confirm_t = batch_confirm<1>;

}  // namespace peggy::schema
