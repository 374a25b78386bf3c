#include <peggy/schema/key/bridge_keys.hpp>
#include <peggy/schema/key/builder.hpp>
#include <peggy/testing/common.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string_view>

namespace {

bool starts_with(const peggy::schema::bytes_t& key,
                 const peggy::schema::bytes_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace

TEST(key_builder, integers_are_big_endian) {
  auto key = peggy::schema::key::builder{}.write(uint64_t{0x0102}).data;
  EXPECT_EQ(key, (peggy::schema::bytes_t{0, 0, 0, 0, 0, 0, 0x01, 0x02}));

  auto small = peggy::schema::key::builder{}.write(uint32_t{7}).data;
  EXPECT_EQ(small, (peggy::schema::bytes_t{0, 0, 0, 7}));
}

TEST(key_builder, amounts_are_fixed_width) {
  auto key = peggy::schema::key::builder{}
                 .write(peggy::schema::amount_t{0x0100})
                 .data;
  ASSERT_EQ(key.size(), 32u);
  EXPECT_EQ(key[30], 0x01);
  EXPECT_EQ(key[31], 0x00);
  EXPECT_TRUE(std::all_of(std::begin(key), std::begin(key) + 30,
                          [](uint8_t b) { return b == 0; }));
}

TEST(key_builder, sized_components_carry_length) {
  auto key = peggy::schema::key::builder{}
                 .write_sized(peggy::schema::bytes_t{0xAA, 0xBB})
                 .data;
  EXPECT_EQ(key, (peggy::schema::bytes_t{0, 0, 0, 2, 0xAA, 0xBB}));
}

TEST(key_builder, valset_keys_sort_numerically) {
  auto low = peggy::schema::key::make_valset_key(9);
  auto high = peggy::schema::key::make_valset_key(256);
  EXPECT_LT(low, high);
  EXPECT_TRUE(starts_with(
      low, peggy::schema::key::make_prefix_key(
               peggy::schema::key::kValsetKeyPrefix)));
}

TEST(key_builder, pool_fee_keys_sort_fee_descending_then_id) {
  const auto token = peggy::testing::make_eth_address(1);
  auto high_fee = peggy::schema::key::make_pool_fee_key(token, 9, 5);
  auto low_fee = peggy::schema::key::make_pool_fee_key(token, 2, 1);
  auto low_fee_later = peggy::schema::key::make_pool_fee_key(token, 2, 3);
  EXPECT_LT(high_fee, low_fee);
  EXPECT_LT(low_fee, low_fee_later);

  auto prefix = peggy::schema::key::make_pool_fee_prefix_key(token);
  EXPECT_TRUE(starts_with(high_fee, prefix));
  EXPECT_FALSE(starts_with(
      high_fee, peggy::schema::key::make_pool_fee_prefix_key(
                    peggy::testing::make_eth_address(2))));
}

TEST(key_builder, batch_nonce_prefix_covers_every_contract) {
  auto prefix = peggy::schema::key::make_batch_nonce_prefix_key(4);
  EXPECT_TRUE(starts_with(
      peggy::schema::key::make_batch_key(4, peggy::testing::make_eth_address(1)),
      prefix));
  EXPECT_TRUE(starts_with(
      peggy::schema::key::make_batch_key(4, peggy::testing::make_eth_address(7)),
      prefix));
  EXPECT_FALSE(starts_with(
      peggy::schema::key::make_batch_key(5, peggy::testing::make_eth_address(1)),
      prefix));
}

TEST(key_builder, confirm_keys_extend_their_subject_prefix) {
  auto prefix = peggy::schema::key::make_valset_confirm_prefix_key(3);
  auto key = peggy::schema::key::make_confirm_key(
      prefix, peggy::testing::make_address(1));
  EXPECT_TRUE(starts_with(key, prefix));
  EXPECT_FALSE(
      starts_with(key, peggy::schema::key::make_valset_confirm_prefix_key(4)));
}

TEST(key_builder, keyspaces_do_not_overlap) {
  const auto& spaces = peggy::schema::key::kBridgeKeyspaces;
  for (std::size_t i = 0; i < spaces.size(); ++i) {
    for (std::size_t j = 0; j < spaces.size(); ++j) {
      if (i != j) {
        EXPECT_FALSE(spaces[i].starts_with(spaces[j]))
            << spaces[i] << " overlaps " << spaces[j];
      }
    }
  }
}
