#include <peggy/schema/encoding/scale/encoder.hpp>
#include <peggy/schema/message_type.hpp>
#include <peggy/schema/query_result.hpp>
#include <peggy/schema/transaction.hpp>
#include <peggy/schema/valset.hpp>
#include <peggy/testing/common.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <variant>

namespace {

using encoder_t = peggy::schema::encoding::scale_encoder_t;
using peggy::testing::make_address;
using peggy::testing::make_eth_address;

}  // namespace

TEST(encoding_types, send_to_eth_transaction_survives_encoding) {
  auto encoder = encoder_t{};
  auto tx = peggy::testing::make_transaction(
      make_address(1),
      peggy::schema::send_to_eth_t{
          .sender = make_address(1),
          .eth_dest = make_eth_address(2),
          .amount = {.denom = "stake", .amount = 100},
          .bridge_fee = {.denom = "stake", .amount = 3}});

  auto encoded = encoder.encode(tx);
  auto decoded = encoder.decode<peggy::schema::transaction_t>(encoded);
  EXPECT_EQ(decoded.version, 1u);
  EXPECT_EQ(decoded.signer, make_address(1));
  ASSERT_TRUE(std::holds_alternative<peggy::schema::send_to_eth_t>(
      decoded.payload));
  const auto& msg = std::get<peggy::schema::send_to_eth_t>(decoded.payload);
  EXPECT_EQ(msg.eth_dest, make_eth_address(2));
  EXPECT_EQ(msg.amount.amount, 100);
  EXPECT_EQ(msg.bridge_fee.denom, "stake");
}

TEST(encoding_types, logic_call_transaction_keeps_nested_collections) {
  auto encoder = encoder_t{};
  auto tx = peggy::testing::make_transaction(
      make_address(9),
      peggy::schema::submit_logic_call_t{
          .call = {.transfers = {{.contract = make_eth_address(1),
                                  .amount = 5},
                                 {.contract = make_eth_address(2),
                                  .amount = 6}},
                   .fees = {{.contract = make_eth_address(1), .amount = 1}},
                   .logic_contract_address = make_eth_address(3),
                   .payload = {0xCA, 0xFE},
                   .timeout = 900,
                   .invalidation_id = {0x01, 0x02, 0x03},
                   .invalidation_nonce = 4}});

  auto decoded = encoder.decode<peggy::schema::transaction_t>(
      encoder.encode(tx));
  ASSERT_EQ(peggy::schema::message_type_of(decoded.payload),
            peggy::schema::message_type_t::submit_logic_call);
  const auto& call =
      std::get<peggy::schema::submit_logic_call_t>(decoded.payload).call;
  ASSERT_EQ(call.transfers.size(), 2u);
  EXPECT_EQ(call.transfers[1].amount, 6);
  EXPECT_EQ(call.fees.size(), 1u);
  EXPECT_EQ(call.payload, (peggy::schema::bytes_t{0xCA, 0xFE}));
  EXPECT_EQ(call.timeout, 900u);
  EXPECT_EQ(call.invalidation_id, (peggy::schema::bytes_t{0x01, 0x02, 0x03}));
  EXPECT_EQ(call.invalidation_nonce, 4u);
}

TEST(encoding_types, full_width_amounts_survive_encoding) {
  auto encoder = encoder_t{};
  const auto max = std::numeric_limits<peggy::schema::amount_t>::max();
  auto coin = peggy::schema::coin_t{.denom = "wei", .amount = max};
  auto decoded = encoder.decode<peggy::schema::coin_t>(encoder.encode(coin));
  EXPECT_EQ(decoded.amount, max);
}

TEST(encoding_types, truncated_bytes_fail_to_decode) {
  auto encoder = encoder_t{};
  auto valset = peggy::schema::valset_t{
      .nonce = 3,
      .height = 10,
      .members = {{.power = 7, .ethereum_address = make_eth_address(1)}}};
  auto encoded = encoder.encode(valset);
  encoded.resize(encoded.size() - 4);
  EXPECT_FALSE(encoder
                   .try_decode<peggy::schema::valset_t>(
                       peggy::schema::bytes_view_t{encoded.data(),
                                                   encoded.size()})
                   .has_value());

  auto garbage = peggy::schema::bytes_t{0xFF};
  EXPECT_FALSE(encoder
                   .try_decode<peggy::schema::transaction_t>(
                       peggy::schema::bytes_view_t{garbage.data(),
                                                   garbage.size()})
                   .has_value());
}

TEST(encoding_types, message_type_names_follow_variant_order) {
  for (const auto& [name, type] : peggy::schema::kMessageTypeMappings) {
    EXPECT_EQ(peggy::schema::to_string(type), name);
    EXPECT_EQ(peggy::schema::try_from_string<peggy::schema::message_type_t>(
                  name),
              type);
  }
  EXPECT_FALSE(peggy::schema::try_from_string<peggy::schema::message_type_t>(
                   "transfer")
                   .has_value());

  auto payload = peggy::schema::transaction_payload_t{
      peggy::schema::set_asset_mapping_t{}};
  EXPECT_EQ(peggy::schema::message_type_of(payload),
            peggy::schema::message_type_t::set_asset_mapping);
  EXPECT_EQ(peggy::schema::to_string(peggy::schema::message_type_of(payload)),
            "set_asset_mapping");
}

TEST(encoding_types, default_query_result_is_success) {
  auto result = peggy::schema::query_result_t{};
  EXPECT_EQ(result.version, 1u);
  EXPECT_EQ(result.code, 0u);
  EXPECT_TRUE(result.value.empty());
  EXPECT_EQ(result.height, 0);
}
