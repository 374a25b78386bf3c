#pragma once

#include <peggy/schema/enum_string.hpp>
#include <peggy/schema/transaction.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace peggy::schema {

/// Discriminator of transaction_payload_t. Values match the variant index.
enum class message_type_t : uint8_t {
  register_eth_address = 0,
  request_valset = 1,
  send_to_eth = 2,
  cancel_send_to_eth = 3,
  request_batch = 4,
  valset_confirm = 5,
  batch_confirm = 6,
  logic_call_confirm = 7,
  submit_logic_call = 8,
  set_asset_mapping = 9
};

inline constexpr auto kMessageTypeMappings = std::array{
    std::pair<std::string_view, message_type_t>{
        "register_eth_address", message_type_t::register_eth_address},
    std::pair<std::string_view, message_type_t>{
        "request_valset", message_type_t::request_valset},
    std::pair<std::string_view, message_type_t>{"send_to_eth",
                                                message_type_t::send_to_eth},
    std::pair<std::string_view, message_type_t>{
        "cancel_send_to_eth", message_type_t::cancel_send_to_eth},
    std::pair<std::string_view, message_type_t>{"request_batch",
                                                message_type_t::request_batch},
    std::pair<std::string_view, message_type_t>{
        "valset_confirm", message_type_t::valset_confirm},
    std::pair<std::string_view, message_type_t>{"batch_confirm",
                                                message_type_t::batch_confirm},
    std::pair<std::string_view, message_type_t>{
        "logic_call_confirm", message_type_t::logic_call_confirm},
    std::pair<std::string_view, message_type_t>{
        "submit_logic_call", message_type_t::submit_logic_call},
    std::pair<std::string_view, message_type_t>{
        "set_asset_mapping", message_type_t::set_asset_mapping},
};

static_assert(kMessageTypeMappings.size() ==
              std::variant_size_v<transaction_payload_t>);

template <>
inline std::optional<message_type_t> try_from_string<message_type_t>(
    const std::string_view value) {
  return from_string(value, kMessageTypeMappings);
}

inline constexpr std::string_view to_string(const message_type_t value) {
  return to_string(value, kMessageTypeMappings).value_or("unknown");
}

inline message_type_t message_type_of(const transaction_payload_t& payload) {
  return static_cast<message_type_t>(payload.index());
}

}  // namespace peggy::schema
