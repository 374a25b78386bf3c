#pragma once
#include <peggy/schema/primitives.hpp>

namespace peggy::schema {

template <uint16_t Version>
struct logic_call_confirm;

template <>
struct logic_call_confirm<1> final {
  bytes_t invalidation_id;
  uint64_t invalidation_nonce{};
  native_address_t orchestrator;
  eth_address_t eth_signer{};
  bytes_t signature;
};

using logic_call_confirm_t = logic_call_confirm<1>;

}  // namespace peggy::schema
