#pragma once

#include <spdlog/spdlog.h>
#include <peggy/bridge/collaborators.hpp>
#include <peggy/bridge/sequence.hpp>
#include <peggy/common/critical.hpp>
#include <peggy/schema/key/bridge_keys.hpp>
#include <peggy/schema/outgoing_transfer_tx.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace peggy::bridge {

/// Unbatched outgoing transfers.
///
/// Each transfer is stored once by id and indexed once per token contract by
/// (fee descending, id ascending), the order in which batches consume them.
template <typename Encoder, typename Store>
class outgoing_pool final {
 public:
  outgoing_pool(Encoder& encoder, Store& store)
      : encoder_{encoder}, store_{store} {}

  /// Escrow amount + fee of `denom` from the sender and queue the transfer.
  ///
  /// Returns the new transfer id, or std::nullopt when escrow is declined for
  /// insufficient funds; the pool is untouched in that case.
  std::optional<uint64_t> enqueue(
      const peggy::schema::native_address_t& sender,
      const peggy::schema::eth_address_t& destination,
      const peggy::schema::erc20_token_t& amount,
      const peggy::schema::erc20_token_t& fee,
      const std::string& denom,
      const escrow_t& escrow) {
    auto total = peggy::schema::coin_t{.denom = denom,
                                       .amount = amount.amount + fee.amount};
    if (!escrow || !escrow(sender, total)) {
      spdlog::debug("Escrow of {} {} declined for {}",
                    peggy::schema::to_string(total.amount), denom, sender);
      return std::nullopt;
    }

    auto tx = peggy::schema::outgoing_transfer_tx_t{
        .id = next_sequence(encoder_, store_,
                            peggy::schema::key::kOutgoingTxSequence),
        .sender = sender,
        .dest_address = destination,
        .erc20_token = amount,
        .erc20_fee = fee};
    store_.put(encoder_, peggy::schema::key::make_pool_tx_key(tx.id), tx);
    store_.put(encoder_,
               peggy::schema::key::make_pool_fee_key(tx.erc20_token.contract,
                                                     tx.erc20_fee.amount, tx.id),
               tx.id);
    store_.put(encoder_, peggy::schema::key::make_pool_denom_key(tx.id), denom);
    return tx.id;
  }

  /// Denom escrowed when the transfer was queued.
  std::optional<std::string> escrowed_denom(uint64_t id) const {
    return store_.template get<std::string>(
        encoder_, peggy::schema::key::make_pool_denom_key(id));
  }

  std::optional<peggy::schema::outgoing_transfer_tx_t> get(uint64_t id) const {
    return store_.template get<peggy::schema::outgoing_transfer_tx_t>(
        encoder_, peggy::schema::key::make_pool_tx_key(id));
  }

  /// Remove one transfer. Returns the removed entry, std::nullopt if absent.
  std::optional<peggy::schema::outgoing_transfer_tx_t> remove(uint64_t id) {
    auto tx = get(id);
    if (!tx) {
      return std::nullopt;
    }
    store_.erase(peggy::schema::key::make_pool_tx_key(id));
    store_.erase(peggy::schema::key::make_pool_fee_key(
        tx->erc20_token.contract, tx->erc20_fee.amount, id));
    store_.erase(peggy::schema::key::make_pool_denom_key(id));
    return tx;
  }

  void dequeue(const std::vector<uint64_t>& ids) {
    for (const auto id : ids) {
      remove(id);
    }
  }

  /// Up to `limit` transfers for one token contract, fee descending then id
  /// ascending.
  std::vector<peggy::schema::outgoing_transfer_tx_t> by_fee(
      const peggy::schema::eth_address_t& token_contract,
      const std::size_t limit) const {
    auto out = std::vector<peggy::schema::outgoing_transfer_tx_t>{};
    auto prefix = peggy::schema::key::make_pool_fee_prefix_key(token_contract);
    for (const auto& [key, value] : store_.list_by_prefix(prefix)) {
      if (out.size() >= limit) {
        break;
      }
      auto id = encoder_.template decode<uint64_t>(value);
      auto tx = get(id);
      if (!tx) {
        peggy::common::critical("outgoing pool fee index references no transfer");
      }
      out.push_back(std::move(*tx));
    }
    return out;
  }

  /// All queued transfers, id ascending.
  std::vector<peggy::schema::outgoing_transfer_tx_t> list() const {
    auto out = std::vector<peggy::schema::outgoing_transfer_tx_t>{};
    auto prefix =
        peggy::schema::key::make_prefix_key(peggy::schema::key::kPoolTxKeyPrefix);
    for (const auto& [key, value] : store_.list_by_prefix(prefix)) {
      out.push_back(
          encoder_.template decode<peggy::schema::outgoing_transfer_tx_t>(value));
    }
    return out;
  }

  std::vector<peggy::schema::outgoing_transfer_tx_t> list_by_sender(
      const peggy::schema::native_address_t& sender) const {
    auto out = std::vector<peggy::schema::outgoing_transfer_tx_t>{};
    for (auto& tx : list()) {
      if (tx.sender == sender) {
        out.push_back(std::move(tx));
      }
    }
    return out;
  }

  /// Remove an unbatched transfer owned by `sender` and refund amount + fee
  /// in the denom that was escrowed for it. Returns false when no such
  /// transfer is queued.
  bool cancel(uint64_t id,
              const peggy::schema::native_address_t& sender,
              const refund_t& refund) {
    auto tx = get(id);
    if (!tx || tx->sender != sender) {
      return false;
    }
    auto denom = escrowed_denom(id);
    if (!denom) {
      peggy::common::critical("queued transfer has no escrowed denom");
    }
    remove(id);
    if (refund) {
      refund(sender, peggy::schema::coin_t{
                         .denom = std::move(*denom),
                         .amount = tx->erc20_token.amount +
                                   tx->erc20_fee.amount});
    }
    spdlog::info("Cancelled outgoing transfer {} for {}", id, sender);
    return true;
  }

 private:
  Encoder& encoder_;
  Store& store_;
};

}  // namespace peggy::bridge
