#pragma once

#include <spdlog/spdlog.h>
#include <peggy/schema/key/bridge_keys.hpp>
#include <peggy/schema/primitives.hpp>
#include <optional>

namespace peggy::bridge {

/// Validator identity to Ethereum signing address. A later registration for
/// the same validator replaces the earlier one; two validators may register
/// the same Ethereum address.
template <typename Encoder, typename Store>
class validator_registry final {
 public:
  validator_registry(Encoder& encoder, Store& store)
      : encoder_{encoder}, store_{store} {}

  void set_eth_address(const peggy::schema::native_address_t& validator,
                       const peggy::schema::eth_address_t& address) {
    store_.put(encoder_, peggy::schema::key::make_eth_address_key(validator),
               address);
    spdlog::debug("Registered ethereum address {} for {}",
                  peggy::schema::to_string(address), validator);
  }

  std::optional<peggy::schema::eth_address_t> eth_address(
      const peggy::schema::native_address_t& validator) const {
    return store_.template get<peggy::schema::eth_address_t>(
        encoder_, peggy::schema::key::make_eth_address_key(validator));
  }

 private:
  Encoder& encoder_;
  Store& store_;
};

}  // namespace peggy::bridge
