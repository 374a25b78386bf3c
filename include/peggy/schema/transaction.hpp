#pragma once
#include <peggy/schema/batch_confirm.hpp>
#include <peggy/schema/cancel_send_to_eth.hpp>
#include <peggy/schema/logic_call_confirm.hpp>
#include <peggy/schema/primitives.hpp>
#include <peggy/schema/register_eth_address.hpp>
#include <peggy/schema/request_batch.hpp>
#include <peggy/schema/request_valset.hpp>
#include <peggy/schema/send_to_eth.hpp>
#include <peggy/schema/set_asset_mapping.hpp>
#include <peggy/schema/submit_logic_call.hpp>
#include <peggy/schema/valset_confirm.hpp>
#include <variant>

namespace peggy::schema {

using transaction_payload_t = std::variant<register_eth_address_t,
                                           request_valset_t,
                                           send_to_eth_t,
                                           cancel_send_to_eth_t,
                                           request_batch_t,
                                           valset_confirm_t,
                                           batch_confirm_t,
                                           logic_call_confirm_t,
                                           submit_logic_call_t,
                                           set_asset_mapping_t>;

template <uint16_t Version>
struct transaction;

// Envelope authentication (account signature, sequence) is performed by the
// hosting chain before the engine sees the transaction; `signer` is the
// already authenticated account.
template <>
struct transaction<1> final {
  uint16_t version{1};
  native_address_t signer;
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace peggy::schema
