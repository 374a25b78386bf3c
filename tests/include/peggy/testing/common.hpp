#pragma once

#include <peggy/schema/primitives.hpp>
#include <peggy/schema/transaction.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace peggy::testing {

inline peggy::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = peggy::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Deterministic bech32 account under the "cosmos" prefix. Larger seeds sort
/// after smaller ones only by accident; compare strings when order matters.
inline peggy::schema::native_address_t make_address(const uint8_t seed) {
  auto payload = peggy::schema::bytes_t(20);
  for (std::size_t i = 0; i < payload.size(); ++i) {
    payload[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return peggy::schema::encode_bech32("cosmos", payload);
}

/// First byte is the seed, so addresses order like their seeds.
inline peggy::schema::eth_address_t make_eth_address(const uint8_t seed) {
  auto out = peggy::schema::eth_address_t{};
  out[0] = seed;
  for (std::size_t i = 1; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(0xA0u + i);
  }
  return out;
}

inline peggy::schema::transaction_t make_transaction(
    const peggy::schema::native_address_t& signer,
    peggy::schema::transaction_payload_t payload) {
  return peggy::schema::transaction_t{
      .version = 1, .signer = signer, .payload = std::move(payload)};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace peggy::testing
