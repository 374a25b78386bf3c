#pragma once

#include <peggy/bridge/collaborators.hpp>
#include <peggy/bridge/outgoing_pool.hpp>
#include <peggy/bridge/validator_registry.hpp>
#include <peggy/schema/encoding/scale/encoder.hpp>
#include <peggy/storage/memory/storage.hpp>
#include <peggy/testing/common.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace peggy::testing {

using scale_encoder_t = peggy::schema::encoding::scale_encoder_t;
using memory_store_t = peggy::storage::memory_storage_t;

/// In-memory store plus a staking table for exercising bridge components
/// without an engine.
class bridge_fixture final {
 public:
  scale_encoder_t& encoder() { return encoder_; }
  memory_store_t& store() { return store_; }

  void bond(const peggy::schema::native_address_t& validator, uint64_t stake) {
    bonded_.push_back(peggy::schema::bonded_validator_t{
        .operator_address = validator, .power = stake});
  }

  /// Bond and register an Ethereum address for the validator.
  void add_validator(const peggy::schema::native_address_t& validator,
                     const peggy::schema::eth_address_t& eth_address,
                     uint64_t stake) {
    bond(validator, stake);
    peggy::bridge::validator_registry<scale_encoder_t, memory_store_t>{
        encoder_, store_}
        .set_eth_address(validator, eth_address);
  }

  peggy::bridge::staking_source_t staking() {
    return [this] { return bonded_; };
  }

  static peggy::bridge::escrow_t approve_all() {
    return [](const peggy::schema::native_address_t&,
              const peggy::schema::coin_t&) { return true; };
  }

  /// Queue a transfer of `amount` with `fee`, both in `contract`.
  uint64_t enqueue(const peggy::schema::native_address_t& sender,
                   const peggy::schema::eth_address_t& contract,
                   uint64_t amount,
                   uint64_t fee) {
    auto pool = peggy::bridge::outgoing_pool<scale_encoder_t, memory_store_t>{
        encoder_, store_};
    auto id = pool.enqueue(
        sender, make_eth_address(0xEE),
        peggy::schema::erc20_token_t{.contract = contract, .amount = amount},
        peggy::schema::erc20_token_t{.contract = contract, .amount = fee},
        "stake", approve_all());
    return id.value_or(0);
  }

 private:
  scale_encoder_t encoder_{};
  memory_store_t store_{};
  std::vector<peggy::schema::bonded_validator_t> bonded_;
};

}  // namespace peggy::testing
