#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace peggy::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using amount_t = boost::multiprecision::uint256_t;

// 20 byte Ethereum account or contract address.
using eth_address_t = std::array<uint8_t, 20>;

// Bech32 encoded account or validator address on the native chain.
using native_address_t = std::string;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(const std::string_view encoded);
bytes_t from_base64(const std::string_view encoded);

/// Parse a 0x prefixed (or bare) 40 character hex address. Case is not
/// checked against an EIP-55 checksum.
std::optional<eth_address_t> try_make_eth_address(const std::string_view hex);
eth_address_t make_eth_address(const std::string_view hex);

/// Lowercase 0x prefixed rendering of an Ethereum address.
std::string to_string(const eth_address_t& address);

/// Decode a BIP-173 bech32 string into its human readable part and payload.
std::optional<std::pair<std::string, bytes_t>> try_decode_bech32(
    const std::string_view encoded);

/// Encode payload bytes as a lowercase bech32 string under hrp.
std::string encode_bech32(const std::string_view hrp,
                          const bytes_view_t& payload);

/// True when address is a lowercase, checksummed bech32 string carrying a 20
/// or 32 byte account payload. The uppercase form is rejected.
bool is_valid_native_address(const std::string_view address);

/// Amount rendering helpers used by event attributes and the CLI.
std::string to_string(const amount_t& amount);
std::optional<amount_t> try_make_amount(const std::string_view decimal);

}  // namespace peggy::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
