#include <peggy/schema/primitives.hpp>
#include <peggy/testing/common.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

TEST(primitives, hex_round_trip_and_prefix) {
  auto bytes = peggy::schema::bytes_t{0x00, 0x7F, 0xAB, 0xFF};
  EXPECT_EQ(peggy::schema::to_hex(bytes), "007fabff");
  EXPECT_EQ(peggy::schema::from_hex("0x007FABff"), bytes);
  EXPECT_FALSE(peggy::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(peggy::schema::try_from_hex("zz").has_value());
  EXPECT_TRUE(peggy::schema::try_from_hex("").value().empty());
}

TEST(primitives, base64_padding) {
  EXPECT_EQ(peggy::schema::to_base64(peggy::schema::make_bytes(
                std::string_view{"f"})),
            "Zg==");
  EXPECT_EQ(peggy::schema::to_base64(peggy::schema::make_bytes(
                std::string_view{"fo"})),
            "Zm8=");
  EXPECT_EQ(peggy::schema::to_base64(peggy::schema::make_bytes(
                std::string_view{"foo"})),
            "Zm9v");
  EXPECT_EQ(peggy::schema::make_string(peggy::schema::from_base64("Zm9vYg==")),
            "foob");
  EXPECT_FALSE(peggy::schema::try_from_base64("Zm9").has_value());
  EXPECT_FALSE(peggy::schema::try_from_base64("Zg==Zm9v").has_value());
}

TEST(primitives, bech32_reference_vectors) {
  auto decoded = peggy::schema::try_decode_bech32(
      "abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxw");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->first, "abcdef");
  EXPECT_EQ(peggy::schema::to_hex(decoded->second),
            "00443214c74254b635cf84653a56d7c675be77df");

  auto empty = peggy::schema::try_decode_bech32("a12uel5l");
  ASSERT_TRUE(empty.has_value());
  EXPECT_EQ(empty->first, "a");
  EXPECT_TRUE(empty->second.empty());

  EXPECT_FALSE(peggy::schema::try_decode_bech32(
                   "abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxy")
                   .has_value());
  EXPECT_FALSE(peggy::schema::try_decode_bech32("A12uEL5L").has_value());
  EXPECT_FALSE(peggy::schema::try_decode_bech32("1qzzfhee").has_value());
}

TEST(primitives, bech32_encode_matches_decode) {
  auto payload = peggy::schema::from_hex(
      "00443214c74254b635cf84653a56d7c675be77df");
  EXPECT_EQ(peggy::schema::encode_bech32("abcdef", payload),
            "abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxw");
}

TEST(primitives, native_address_validation) {
  auto account = peggy::testing::make_address(1);
  EXPECT_EQ(account.substr(0, 7), "cosmos1");
  EXPECT_TRUE(peggy::schema::is_valid_native_address(account));

  auto wide = peggy::schema::encode_bech32("cosmos",
                                           peggy::schema::bytes_t(32, 0x42));
  EXPECT_TRUE(peggy::schema::is_valid_native_address(wide));

  auto short_payload =
      peggy::schema::encode_bech32("cosmos", peggy::schema::bytes_t(19, 0x42));
  EXPECT_FALSE(peggy::schema::is_valid_native_address(short_payload));

  auto corrupted = account;
  corrupted.back() = corrupted.back() == 'q' ? 'p' : 'q';
  EXPECT_FALSE(peggy::schema::is_valid_native_address(corrupted));
  EXPECT_FALSE(peggy::schema::is_valid_native_address(""));
  EXPECT_FALSE(peggy::schema::is_valid_native_address("not-an-address"));
}

TEST(primitives, native_address_uppercase_form_is_rejected) {
  auto account = peggy::schema::encode_bech32("cosmos",
                                              peggy::schema::bytes_t(20, 0x01));
  auto upper = account;
  std::transform(std::begin(upper), std::end(upper), std::begin(upper),
                 [](const unsigned char c) {
                   return static_cast<char>(std::toupper(c));
                 });

  // Still a well formed bech32 string, but not a canonical account key.
  EXPECT_TRUE(peggy::schema::try_decode_bech32(upper).has_value());
  EXPECT_TRUE(peggy::schema::is_valid_native_address(account));
  EXPECT_FALSE(peggy::schema::is_valid_native_address(upper));
}

TEST(primitives, eth_address_rendering) {
  auto address = peggy::schema::make_eth_address(
      "0xAbCdEf0123456789aBcDeF0123456789ABCDEF01");
  EXPECT_EQ(peggy::schema::to_string(address),
            "0xabcdef0123456789abcdef0123456789abcdef01");
  EXPECT_EQ(peggy::schema::try_make_eth_address(
                "abcdef0123456789abcdef0123456789abcdef01"),
            address);
  EXPECT_FALSE(
      peggy::schema::try_make_eth_address("0xabcdef").has_value());
  EXPECT_FALSE(peggy::schema::try_make_eth_address(
                   "0xgbcdef0123456789abcdef0123456789abcdef01")
                   .has_value());
}

TEST(primitives, amounts_parse_full_256_bit_range) {
  EXPECT_EQ(peggy::schema::try_make_amount("0"), peggy::schema::amount_t{0});
  auto max = peggy::schema::try_make_amount(
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639935");
  ASSERT_TRUE(max.has_value());
  EXPECT_EQ(*max, std::numeric_limits<peggy::schema::amount_t>::max());
  EXPECT_EQ(peggy::schema::to_string(*max),
            "115792089237316195423570985008687907853269984665640564039457584007"
            "913129639935");
  EXPECT_FALSE(peggy::schema::try_make_amount(
                   "115792089237316195423570985008687907853269984665640564039457"
                   "584007913129639936")
                   .has_value());
  EXPECT_FALSE(peggy::schema::try_make_amount("").has_value());
  EXPECT_FALSE(peggy::schema::try_make_amount("-1").has_value());
  EXPECT_FALSE(peggy::schema::try_make_amount("12a").has_value());
}
