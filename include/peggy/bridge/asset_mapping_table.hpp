#pragma once

#include <spdlog/spdlog.h>
#include <peggy/schema/asset_mapping.hpp>
#include <peggy/schema/denom_to_erc20.hpp>
#include <peggy/schema/erc20_to_denom.hpp>
#include <peggy/schema/key/bridge_keys.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace peggy::bridge {

inline constexpr std::string_view kDefaultVoucherDenomPrefix{"peggy"};

/// Native denom of an Ethereum-originated token without an explicit mapping:
/// prefix followed by the lowercase 0x address.
inline std::string voucher_denom(const std::string_view prefix,
                                 const peggy::schema::eth_address_t& contract) {
  auto denom = std::string{prefix};
  denom += peggy::schema::to_string(contract);
  return denom;
}

/// Inverse of voucher_denom. Only the canonical lowercase rendering parses.
inline std::optional<peggy::schema::eth_address_t> parse_voucher_denom(
    const std::string_view prefix,
    const std::string_view denom) {
  if (!denom.starts_with(prefix)) {
    return std::nullopt;
  }
  auto rest = denom.substr(prefix.size());
  if (!rest.starts_with("0x")) {
    return std::nullopt;
  }
  auto contract = peggy::schema::try_make_eth_address(rest);
  if (!contract || peggy::schema::to_string(*contract) != rest) {
    return std::nullopt;
  }
  return contract;
}

/// Bidirectional denom <-> token contract index. Both directions hold the
/// same asset_mapping record; overwriting either side drops the stale
/// reverse entry.
template <typename Encoder, typename Store>
class asset_mapping_table final {
 public:
  asset_mapping_table(Encoder& encoder,
                      Store& store,
                      std::string voucher_prefix =
                          std::string{kDefaultVoucherDenomPrefix})
      : encoder_{encoder},
        store_{store},
        voucher_prefix_{std::move(voucher_prefix)} {}

  void set_mapping(const std::string& denom,
                   const peggy::schema::eth_address_t& contract,
                   bool cosmos_originated) {
    if (auto previous = contract_of(denom);
        previous && previous->erc20 != contract) {
      store_.erase(peggy::schema::key::make_erc20_to_denom_key(previous->erc20));
    }
    if (auto previous = denom_of(contract);
        previous && previous->denom != denom) {
      store_.erase(peggy::schema::key::make_denom_to_erc20_key(previous->denom));
    }

    auto mapping = peggy::schema::asset_mapping_t{
        .denom = denom,
        .erc20 = contract,
        .cosmos_originated = cosmos_originated};
    store_.put(encoder_, peggy::schema::key::make_denom_to_erc20_key(denom),
               mapping);
    store_.put(encoder_, peggy::schema::key::make_erc20_to_denom_key(contract),
               mapping);
    spdlog::info("Mapped denom {} to {} (cosmos originated: {})", denom,
                 peggy::schema::to_string(contract), cosmos_originated);
  }

  std::optional<peggy::schema::asset_mapping_t> denom_of(
      const peggy::schema::eth_address_t& contract) const {
    return store_.template get<peggy::schema::asset_mapping_t>(
        encoder_, peggy::schema::key::make_erc20_to_denom_key(contract));
  }

  std::optional<peggy::schema::asset_mapping_t> contract_of(
      const std::string_view denom) const {
    return store_.template get<peggy::schema::asset_mapping_t>(
        encoder_, peggy::schema::key::make_denom_to_erc20_key(denom));
  }

  /// Native denom for a token contract, falling back to its voucher denom.
  peggy::schema::erc20_to_denom_t erc20_to_denom(
      const peggy::schema::eth_address_t& contract) const {
    if (auto mapping = denom_of(contract)) {
      return {.denom = mapping->denom,
              .cosmos_originated = mapping->cosmos_originated};
    }
    return {.denom = voucher_denom(voucher_prefix_, contract),
            .cosmos_originated = false};
  }

  /// Token contract for a native denom. A voucher denom resolves to the
  /// contract it names; any other unmapped denom is unknown.
  std::optional<peggy::schema::denom_to_erc20_t> denom_to_erc20(
      const std::string_view denom) const {
    if (auto mapping = contract_of(denom)) {
      return peggy::schema::denom_to_erc20_t{
          .erc20 = mapping->erc20,
          .cosmos_originated = mapping->cosmos_originated};
    }
    if (auto contract = parse_voucher_denom(voucher_prefix_, denom)) {
      return peggy::schema::denom_to_erc20_t{.erc20 = *contract,
                                             .cosmos_originated = false};
    }
    return std::nullopt;
  }

  const std::string& voucher_prefix() const { return voucher_prefix_; }

 private:
  Encoder& encoder_;
  Store& store_;
  std::string voucher_prefix_;
};

}  // namespace peggy::bridge
