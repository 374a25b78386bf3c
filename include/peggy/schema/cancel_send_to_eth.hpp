#pragma once
#include <peggy/schema/primitives.hpp>

namespace peggy::schema {

template <uint16_t Version>
struct cancel_send_to_eth;

template <>
struct cancel_send_to_eth<1> final {
  uint16_t version{1};
  native_address_t sender;
  uint64_t transaction_id{};
};

using cancel_send_to_eth_t = cancel_send_to_eth<1>;

}  // namespace peggy::schema
