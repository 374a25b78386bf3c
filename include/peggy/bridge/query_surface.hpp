#pragma once

#include <peggy/bridge/asset_mapping_table.hpp>
#include <peggy/bridge/batch_builder.hpp>
#include <peggy/bridge/confirm_store.hpp>
#include <peggy/bridge/logic_call_registry.hpp>
#include <peggy/bridge/outgoing_pool.hpp>
#include <peggy/bridge/validator_registry.hpp>
#include <peggy/bridge/valset_builder.hpp>
#include <peggy/schema/pending_send_to_eth.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace peggy::bridge {

inline constexpr std::size_t kDefaultLastRequestsLimit = 5;

/// Read-only views composed from the bridge components. Every result has a
/// deterministic order derived from key order.
template <typename Encoder, typename Store>
class query_surface final {
 public:
  query_surface(Encoder& encoder,
                Store& store,
                std::string voucher_prefix =
                    std::string{kDefaultVoucherDenomPrefix},
                std::size_t default_limit = kDefaultLastRequestsLimit)
      : encoder_{encoder},
        store_{store},
        voucher_prefix_{std::move(voucher_prefix)},
        default_limit_{default_limit} {}

  std::optional<peggy::schema::valset_t> current_valset() const {
    return valsets().latest();
  }

  std::optional<peggy::schema::valset_t> valset(uint64_t nonce) const {
    return valsets().get(nonce);
  }

  /// Most recent valsets, nonce descending.
  std::vector<peggy::schema::valset_t> last_valset_requests(
      std::optional<std::size_t> count = std::nullopt) const {
    return valsets().last(count.value_or(default_limit_));
  }

  /// Highest valset `validator` has not confirmed yet.
  std::optional<peggy::schema::valset_t> last_pending_valset_request(
      const peggy::schema::native_address_t& validator) const {
    auto confirms = valset_confirm_store<Encoder, Store>{encoder_, store_};
    return valsets().find_last([&](const peggy::schema::valset_t& valset) {
      return confirms.is_pending(valset.nonce, validator);
    });
  }

  std::optional<peggy::schema::outgoing_tx_batch_t> batch(
      uint64_t batch_nonce,
      const peggy::schema::eth_address_t& token_contract) const {
    return batches().get(batch_nonce, token_contract);
  }

  /// Most recent batches, nonce descending.
  std::vector<peggy::schema::outgoing_tx_batch_t> last_batches(
      std::optional<std::size_t> count = std::nullopt) const {
    return batches().last(count.value_or(default_limit_));
  }

  std::optional<peggy::schema::outgoing_tx_batch_t> last_pending_batch_request(
      const peggy::schema::native_address_t& validator,
      const std::optional<peggy::schema::eth_address_t>& token_contract =
          std::nullopt) const {
    auto confirms = batch_confirm_store<Encoder, Store>{encoder_, store_};
    return batches().find_last(
        [&](const peggy::schema::outgoing_tx_batch_t& batch) {
          if (token_contract && batch.token_contract != *token_contract) {
            return false;
          }
          return confirms.is_pending({batch.batch_nonce, batch.token_contract},
                                     validator);
        });
  }

  std::optional<peggy::schema::outgoing_logic_call_t> logic_call(
      const peggy::schema::bytes_view_t& invalidation_id,
      uint64_t invalidation_nonce) const {
    return logic_calls().get(invalidation_id, invalidation_nonce);
  }

  /// Logic calls in descending key order.
  std::vector<peggy::schema::outgoing_logic_call_t> last_logic_calls(
      std::optional<std::size_t> count = std::nullopt) const {
    return logic_calls().last(count.value_or(default_limit_));
  }

  std::optional<peggy::schema::outgoing_logic_call_t> last_pending_logic_call(
      const peggy::schema::native_address_t& validator) const {
    auto confirms = logic_call_confirm_store<Encoder, Store>{encoder_, store_};
    return logic_calls().find_last(
        [&](const peggy::schema::outgoing_logic_call_t& call) {
          return confirms.is_pending(
              {call.invalidation_id, call.invalidation_nonce}, validator);
        });
  }

  std::optional<peggy::schema::valset_confirm_t> valset_confirm(
      uint64_t nonce,
      const peggy::schema::native_address_t& orchestrator) const {
    return valset_confirm_store<Encoder, Store>{encoder_, store_}.get_confirm(
        nonce, orchestrator);
  }

  std::vector<peggy::schema::valset_confirm_t> valset_confirms(
      uint64_t nonce) const {
    return valset_confirm_store<Encoder, Store>{encoder_, store_}
        .get_all_confirms(nonce);
  }

  std::optional<peggy::schema::batch_confirm_t> batch_confirm(
      uint64_t batch_nonce,
      const peggy::schema::eth_address_t& token_contract,
      const peggy::schema::native_address_t& orchestrator) const {
    return batch_confirm_store<Encoder, Store>{encoder_, store_}.get_confirm(
        {batch_nonce, token_contract}, orchestrator);
  }

  std::vector<peggy::schema::batch_confirm_t> batch_confirms(
      uint64_t batch_nonce,
      const peggy::schema::eth_address_t& token_contract) const {
    return batch_confirm_store<Encoder, Store>{encoder_, store_}
        .get_all_confirms({batch_nonce, token_contract});
  }

  std::optional<peggy::schema::logic_call_confirm_t> logic_call_confirm(
      const peggy::schema::bytes_t& invalidation_id,
      uint64_t invalidation_nonce,
      const peggy::schema::native_address_t& orchestrator) const {
    return logic_call_confirm_store<Encoder, Store>{encoder_, store_}
        .get_confirm({invalidation_id, invalidation_nonce}, orchestrator);
  }

  std::vector<peggy::schema::logic_call_confirm_t> logic_call_confirms(
      const peggy::schema::bytes_t& invalidation_id,
      uint64_t invalidation_nonce) const {
    return logic_call_confirm_store<Encoder, Store>{encoder_, store_}
        .get_all_confirms({invalidation_id, invalidation_nonce});
  }

  /// Outstanding transfers of `sender`: batched ones by batch nonce then
  /// position in the batch, unbatched ones by id.
  peggy::schema::pending_send_to_eth_t pending_send_to_eth(
      const peggy::schema::native_address_t& sender) const {
    auto result = peggy::schema::pending_send_to_eth_t{};
    for (auto& batch : batches().list()) {
      for (auto& tx : batch.transactions) {
        if (tx.sender == sender) {
          result.transfers_in_batches.push_back(std::move(tx));
        }
      }
    }
    result.unbatched_transfers =
        outgoing_pool<Encoder, Store>{encoder_, store_}.list_by_sender(sender);
    return result;
  }

  peggy::schema::erc20_to_denom_t erc20_to_denom(
      const peggy::schema::eth_address_t& contract) const {
    return mappings().erc20_to_denom(contract);
  }

  std::optional<peggy::schema::denom_to_erc20_t> denom_to_erc20(
      const std::string_view denom) const {
    return mappings().denom_to_erc20(denom);
  }

  std::optional<peggy::schema::eth_address_t> eth_address(
      const peggy::schema::native_address_t& validator) const {
    return validator_registry<Encoder, Store>{encoder_, store_}.eth_address(
        validator);
  }

 private:
  valset_store<Encoder, Store> valsets() const { return {encoder_, store_}; }
  batch_store<Encoder, Store> batches() const { return {encoder_, store_}; }
  logic_call_registry<Encoder, Store> logic_calls() const {
    return {encoder_, store_};
  }
  asset_mapping_table<Encoder, Store> mappings() const {
    return {encoder_, store_, voucher_prefix_};
  }

  Encoder& encoder_;
  Store& store_;
  std::string voucher_prefix_;
  std::size_t default_limit_;
};

}  // namespace peggy::bridge
