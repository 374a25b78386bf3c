#include <peggy/execution/engine.hpp>
#include <peggy/schema/query_error_code.hpp>
#include <peggy/schema/valset.hpp>
#include <peggy/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace {

using peggy::schema::query_error_code;
using peggy::testing::make_address;
using peggy::testing::make_eth_address;
using peggy::testing::make_transaction;

uint32_t code_of(query_error_code code) {
  return static_cast<uint32_t>(code);
}

void seed_valsets(peggy::testing::execution_fixture& fixture, uint64_t count) {
  fixture.bond(make_address(1), 1);
  auto txs = std::vector<peggy::schema::transaction_t>{make_transaction(
      make_address(1), peggy::schema::register_eth_address_t{
                           .validator = make_address(1),
                           .eth_address = make_eth_address(1)})};
  for (uint64_t i = 0; i < count; ++i) {
    txs.push_back(make_transaction(
        make_address(1),
        peggy::schema::request_valset_t{.requester = make_address(1)}));
  }
  fixture.execute(1, txs);
}

}  // namespace

TEST(engine_query, missing_record_is_success_with_empty_value) {
  auto fixture = peggy::testing::execution_fixture{"peggy_query_missing"};
  auto result = fixture.query("/valset/7");
  EXPECT_EQ(result.code, 0u);
  EXPECT_TRUE(result.value.empty());
  EXPECT_EQ(result.info, "not found");
  EXPECT_EQ(result.codespace, "peggy.query");

  result = fixture.query("/eth_address/" + make_address(5));
  EXPECT_EQ(result.code, 0u);
  EXPECT_TRUE(result.value.empty());
}

TEST(engine_query, malformed_arguments_are_rejected) {
  auto fixture = peggy::testing::execution_fixture{"peggy_query_malformed"};
  for (const auto* path :
       {"/valset/abc", "/valset/last/-1", "/batch/1/0x1234",
        "/valset/pending/not-an-address", "/logic_call/zz/1",
        "/erc20_to_denom/0x12", "/batch/confirms/x/0x12"}) {
    auto result = fixture.query(path);
    EXPECT_EQ(result.code, code_of(query_error_code::invalid_argument)) << path;
    EXPECT_EQ(result.log, "invalid query argument") << path;
    EXPECT_TRUE(result.value.empty()) << path;
  }
}

TEST(engine_query, unknown_paths_are_unsupported) {
  auto fixture = peggy::testing::execution_fixture{"peggy_query_unknown"};
  for (const auto* path : {"/", "/nope", "/nope/1", "/engine", "/valset",
                           "/valset/confirm/1", "/batch/pending"}) {
    auto result = fixture.query(path);
    EXPECT_EQ(result.code, code_of(query_error_code::unsupported_path)) << path;
    EXPECT_EQ(result.info, path);
  }
}

TEST(engine_query, engine_info_reports_committed_checkpoint) {
  auto fixture = peggy::testing::execution_fixture{"peggy_query_info"};
  seed_valsets(fixture, 1);

  auto result = fixture.query("/engine/info");
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(result.height, 1);
  auto [height, root] =
      fixture.decode<std::tuple<int64_t, peggy::schema::hash32_t>>(
          result.value);
  EXPECT_EQ(height, 1);
  EXPECT_EQ(root, fixture.engine().info().last_block_state_root);
}

TEST(engine_query, last_requests_use_configured_limit) {
  auto options = peggy::execution::engine_options{};
  options.last_requests_limit = 2;
  auto fixture = peggy::testing::execution_fixture{"peggy_query_limit", options};
  seed_valsets(fixture, 4);

  auto result = fixture.query("/valset/last");
  auto valsets =
      fixture.decode<std::vector<peggy::schema::valset_t>>(result.value);
  ASSERT_EQ(valsets.size(), 2u);
  EXPECT_EQ(valsets[0].nonce, 4u);
  EXPECT_EQ(valsets[1].nonce, 3u);

  result = fixture.query("/valset/last/3");
  EXPECT_EQ(
      fixture.decode<std::vector<peggy::schema::valset_t>>(result.value).size(),
      3u);
}

TEST(engine_query, queries_see_only_committed_state) {
  auto fixture = peggy::testing::execution_fixture{"peggy_query_committed"};
  fixture.bond(make_address(1), 1);
  auto raw = fixture.encode(make_transaction(
      make_address(1),
      peggy::schema::request_valset_t{.requester = make_address(1)}));
  fixture.engine().finalize_block(1, {raw});
  EXPECT_TRUE(fixture.query("/valset/current").value.empty());

  fixture.engine().commit();
  EXPECT_FALSE(fixture.query("/valset/current").value.empty());
}

TEST(engine_query, repeated_queries_are_identical) {
  auto fixture = peggy::testing::execution_fixture{"peggy_query_repeat"};
  seed_valsets(fixture, 2);

  auto data = peggy::schema::bytes_t{0x01, 0x02};
  auto first = fixture.engine().query(
      "/valset/last", peggy::schema::bytes_view_t{data.data(), data.size()});
  auto second = fixture.engine().query(
      "/valset/last", peggy::schema::bytes_view_t{data.data(), data.size()});
  EXPECT_EQ(first.code, second.code);
  EXPECT_EQ(first.value, second.value);
  EXPECT_EQ(first.key, data);
  EXPECT_EQ(first.height, second.height);
}

TEST(engine_query, denom_lookup_covers_mapping_and_vouchers) {
  auto fixture = peggy::testing::execution_fixture{"peggy_query_denom"};
  fixture.execute(1, {make_transaction(fixture.authority(),
                                       peggy::schema::set_asset_mapping_t{
                                           .denom = "stake",
                                           .erc20 = make_eth_address(0x30),
                                           .cosmos_originated = true})});

  auto mapped = fixture.query("/denom_to_erc20/stake");
  auto token = fixture.decode<peggy::schema::denom_to_erc20_t>(mapped.value);
  EXPECT_EQ(token.erc20, make_eth_address(0x30));
  EXPECT_TRUE(token.cosmos_originated);

  auto voucher = fixture.query(
      "/denom_to_erc20/peggy" + peggy::schema::to_string(make_eth_address(2)));
  auto voucher_token =
      fixture.decode<peggy::schema::denom_to_erc20_t>(voucher.value);
  EXPECT_EQ(voucher_token.erc20, make_eth_address(2));
  EXPECT_FALSE(voucher_token.cosmos_originated);

  auto unknown = fixture.query("/denom_to_erc20/atom");
  EXPECT_EQ(unknown.code, 0u);
  EXPECT_TRUE(unknown.value.empty());
}

TEST(engine_query, denom_lookup_accepts_slash_in_denom) {
  auto fixture = peggy::testing::execution_fixture{"peggy_query_denom_slash"};
  const auto denom =
      std::string{"ibc/27394FB092D2ECCD56123C74F36E4C1F926001CE"};
  auto mapping = fixture.execute(
      1, {make_transaction(fixture.authority(),
                           peggy::schema::set_asset_mapping_t{
                               .denom = denom,
                               .erc20 = make_eth_address(0x31),
                               .cosmos_originated = true})});
  ASSERT_EQ(mapping.tx_results[0].code, 0u) << mapping.tx_results[0].log;

  auto found = fixture.query("/denom_to_erc20/" + denom);
  ASSERT_EQ(found.code, 0u) << found.info;
  ASSERT_FALSE(found.value.empty());
  EXPECT_EQ(fixture.decode<peggy::schema::denom_to_erc20_t>(found.value).erc20,
            make_eth_address(0x31));

  auto reverse = fixture.query("/erc20_to_denom/" +
                               peggy::schema::to_string(make_eth_address(0x31)));
  EXPECT_EQ(fixture.decode<peggy::schema::erc20_to_denom_t>(reverse.value).denom,
            denom);

  auto other = fixture.query("/denom_to_erc20/ibc/00");
  EXPECT_EQ(other.code, 0u);
  EXPECT_TRUE(other.value.empty());
}
