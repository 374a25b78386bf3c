#include <peggy/bridge/asset_mapping_table.hpp>
#include <peggy/testing/bridge_fixture.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using peggy::testing::make_eth_address;
using table_t =
    peggy::bridge::asset_mapping_table<peggy::testing::scale_encoder_t,
                                       peggy::testing::memory_store_t>;

}  // namespace

TEST(asset_mapping_table, mapping_resolves_both_directions) {
  auto fixture = peggy::testing::bridge_fixture{};
  auto table = table_t{fixture.encoder(), fixture.store()};
  table.set_mapping("stake", make_eth_address(1), true);

  auto to_denom = table.erc20_to_denom(make_eth_address(1));
  EXPECT_EQ(to_denom.denom, "stake");
  EXPECT_TRUE(to_denom.cosmos_originated);

  auto to_erc20 = table.denom_to_erc20("stake");
  ASSERT_TRUE(to_erc20.has_value());
  EXPECT_EQ(to_erc20->erc20, make_eth_address(1));
  EXPECT_TRUE(to_erc20->cosmos_originated);
}

TEST(asset_mapping_table, remapping_drops_stale_reverse_entries) {
  auto fixture = peggy::testing::bridge_fixture{};
  auto table = table_t{fixture.encoder(), fixture.store()};
  table.set_mapping("stake", make_eth_address(1), true);
  table.set_mapping("stake", make_eth_address(2), true);

  EXPECT_FALSE(table.denom_of(make_eth_address(1)).has_value());
  EXPECT_EQ(table.contract_of("stake")->erc20, make_eth_address(2));

  table.set_mapping("atom", make_eth_address(2), false);
  EXPECT_FALSE(table.contract_of("stake").has_value());
  EXPECT_EQ(table.denom_of(make_eth_address(2))->denom, "atom");
  EXPECT_FALSE(table.denom_to_erc20("stake").has_value());
}

TEST(asset_mapping_table, unmapped_contract_falls_back_to_voucher) {
  auto fixture = peggy::testing::bridge_fixture{};
  auto table = table_t{fixture.encoder(), fixture.store()};
  const auto contract = make_eth_address(0xAB);

  auto to_denom = table.erc20_to_denom(contract);
  EXPECT_EQ(to_denom.denom, "peggy" + peggy::schema::to_string(contract));
  EXPECT_FALSE(to_denom.cosmos_originated);

  auto to_erc20 = table.denom_to_erc20(to_denom.denom);
  ASSERT_TRUE(to_erc20.has_value());
  EXPECT_EQ(to_erc20->erc20, contract);
  EXPECT_FALSE(to_erc20->cosmos_originated);

  EXPECT_FALSE(table.denom_to_erc20("unknown").has_value());
}

TEST(asset_mapping_table, voucher_parsing_is_strict) {
  const auto contract = make_eth_address(0xAB);
  const auto canonical = peggy::bridge::voucher_denom("peggy", contract);
  EXPECT_EQ(canonical.substr(0, 7), "peggy0x");
  EXPECT_EQ(peggy::bridge::parse_voucher_denom("peggy", canonical), contract);

  auto upper = canonical;
  for (auto i = std::size_t{7}; i < upper.size(); ++i) {
    if (upper[i] >= 'a' && upper[i] <= 'f') {
      upper[i] = static_cast<char>(upper[i] - 'a' + 'A');
    }
  }
  EXPECT_FALSE(peggy::bridge::parse_voucher_denom("peggy", upper).has_value());
  EXPECT_FALSE(
      peggy::bridge::parse_voucher_denom("peggy", canonical.substr(0, 20))
          .has_value());
  EXPECT_FALSE(peggy::bridge::parse_voucher_denom(
                   "peggy", "peggy" + canonical.substr(7))
                   .has_value());
  EXPECT_FALSE(
      peggy::bridge::parse_voucher_denom("gravity", canonical).has_value());
}

TEST(asset_mapping_table, custom_voucher_prefix) {
  auto fixture = peggy::testing::bridge_fixture{};
  auto table = table_t{fixture.encoder(), fixture.store(), "gravity"};
  const auto contract = make_eth_address(3);
  EXPECT_EQ(table.erc20_to_denom(contract).denom,
            "gravity" + peggy::schema::to_string(contract));
  EXPECT_FALSE(
      table.denom_to_erc20(peggy::bridge::voucher_denom("peggy", contract))
          .has_value());
}
