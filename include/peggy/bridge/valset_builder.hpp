#pragma once

#include <spdlog/spdlog.h>
#include <peggy/bridge/collaborators.hpp>
#include <peggy/bridge/record_scan.hpp>
#include <peggy/bridge/sequence.hpp>
#include <peggy/bridge/validator_registry.hpp>
#include <peggy/common/critical.hpp>
#include <peggy/schema/key/bridge_keys.hpp>
#include <peggy/schema/valset.hpp>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace peggy::bridge {

/// Upper bound of a member's normalized power.
inline constexpr uint32_t kMaxValsetPower = std::numeric_limits<uint32_t>::max();

/// Persisted valsets keyed by nonce.
template <typename Encoder, typename Store>
class valset_store final {
 public:
  valset_store(Encoder& encoder, Store& store)
      : encoder_{encoder}, store_{store} {}

  std::optional<peggy::schema::valset_t> get(uint64_t nonce) const {
    return store_.template get<peggy::schema::valset_t>(
        encoder_, peggy::schema::key::make_valset_key(nonce));
  }

  void put(const peggy::schema::valset_t& valset) {
    auto key = peggy::schema::key::make_valset_key(valset.nonce);
    if (store_.get_raw(key)) {
      peggy::common::critical("valset nonce collision");
    }
    store_.put(encoder_, key, valset);
  }

  /// All valsets, nonce ascending.
  std::vector<peggy::schema::valset_t> list() const {
    auto out = std::vector<peggy::schema::valset_t>{};
    for (const auto& [key, value] : store_.list_by_prefix(prefix())) {
      out.push_back(encoder_.template decode<peggy::schema::valset_t>(value));
    }
    return out;
  }

  /// Up to `count` most recent valsets, nonce descending.
  std::vector<peggy::schema::valset_t> last(std::size_t count) const {
    return last_records<peggy::schema::valset_t>(encoder_, store_, prefix(),
                                                 count);
  }

  /// Most recent valset accepted by `match`.
  template <typename Predicate>
  std::optional<peggy::schema::valset_t> find_last(Predicate&& match) const {
    return find_last_record<peggy::schema::valset_t>(
        encoder_, store_, prefix(), std::forward<Predicate>(match));
  }

  std::optional<peggy::schema::valset_t> latest() const {
    auto nonce =
        last_sequence(encoder_, store_, peggy::schema::key::kValsetSequence);
    if (nonce == 0) {
      return std::nullopt;
    }
    return get(nonce);
  }

 private:
  static peggy::schema::bytes_t prefix() {
    return peggy::schema::key::make_prefix_key(
        peggy::schema::key::kValsetKeyPrefix);
  }

  Encoder& encoder_;
  Store& store_;
};

/// Derives the bridge facing validator set from the staking power table and
/// the validator registry.
template <typename Encoder, typename Store>
class valset_builder final {
 public:
  valset_builder(Encoder& encoder, Store& store, staking_source_t staking)
      : encoder_{encoder}, store_{store}, staking_{std::move(staking)} {}

  /// Normalized members for the current power table without persisting.
  ///
  /// Each member gets floor(stake * (2^32 - 1) / total) where total sums every
  /// bonded validator, registered or not. Validators without a registered
  /// Ethereum address are left out. Ordered by power descending, then
  /// address ascending.
  std::vector<peggy::schema::bridge_validator_t> compute_members() const {
    auto bonded = staking_ ? staking_()
                           : std::vector<peggy::schema::bonded_validator_t>{};

    auto total = peggy::schema::amount_t{0};
    for (const auto& validator : bonded) {
      total += validator.power;
    }

    auto members = std::vector<peggy::schema::bridge_validator_t>{};
    if (total == 0) {
      return members;
    }

    auto registry = validator_registry<Encoder, Store>{encoder_, store_};
    members.reserve(bonded.size());
    for (const auto& validator : bonded) {
      auto address = registry.eth_address(validator.operator_address);
      if (!address) {
        spdlog::debug("Skipping unregistered validator {}",
                      validator.operator_address);
        continue;
      }
      peggy::schema::amount_t scaled =
          (peggy::schema::amount_t{validator.power} * kMaxValsetPower) / total;
      members.push_back(peggy::schema::bridge_validator_t{
          .power = scaled.convert_to<uint32_t>(),
          .ethereum_address = *address});
    }

    std::sort(std::begin(members), std::end(members),
              [](const auto& lhs, const auto& rhs) {
                if (lhs.power != rhs.power) {
                  return lhs.power > rhs.power;
                }
                return lhs.ethereum_address < rhs.ethereum_address;
              });
    return members;
  }

  /// Persist a snapshot of the current members under the next valset nonce.
  peggy::schema::valset_t build_snapshot(uint64_t height) {
    auto valset = peggy::schema::valset_t{
        .nonce = next_sequence(encoder_, store_,
                               peggy::schema::key::kValsetSequence),
        .height = height,
        .members = compute_members()};
    valset_store<Encoder, Store>{encoder_, store_}.put(valset);
    spdlog::info("Created valset {} at height {} with {} member(s)",
                 valset.nonce, valset.height, valset.members.size());
    return valset;
  }

 private:
  Encoder& encoder_;
  Store& store_;
  staking_source_t staking_;
};

}  // namespace peggy::bridge
