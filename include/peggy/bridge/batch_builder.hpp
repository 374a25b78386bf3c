#pragma once

#include <spdlog/spdlog.h>
#include <peggy/bridge/outgoing_pool.hpp>
#include <peggy/bridge/record_scan.hpp>
#include <peggy/bridge/sequence.hpp>
#include <peggy/common/critical.hpp>
#include <peggy/schema/key/bridge_keys.hpp>
#include <peggy/schema/outgoing_tx_batch.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace peggy::bridge {

/// Persisted batches keyed by (batch nonce, token contract).
template <typename Encoder, typename Store>
class batch_store final {
 public:
  batch_store(Encoder& encoder, Store& store)
      : encoder_{encoder}, store_{store} {}

  std::optional<peggy::schema::outgoing_tx_batch_t> get(
      uint64_t batch_nonce,
      const peggy::schema::eth_address_t& token_contract) const {
    return store_.template get<peggy::schema::outgoing_tx_batch_t>(
        encoder_,
        peggy::schema::key::make_batch_key(batch_nonce, token_contract));
  }

  /// A batch nonce is issued once across all contracts; reuse is fatal.
  void put(const peggy::schema::outgoing_tx_batch_t& batch) {
    auto taken = store_.list_by_prefix(
        peggy::schema::key::make_batch_nonce_prefix_key(batch.batch_nonce));
    if (!taken.empty()) {
      peggy::common::critical("duplicate batch nonce");
    }
    store_.put(encoder_,
               peggy::schema::key::make_batch_key(batch.batch_nonce,
                                                  batch.token_contract),
               batch);
  }

  /// All batches, nonce ascending.
  std::vector<peggy::schema::outgoing_tx_batch_t> list() const {
    auto out = std::vector<peggy::schema::outgoing_tx_batch_t>{};
    for (const auto& [key, value] : store_.list_by_prefix(prefix())) {
      out.push_back(
          encoder_.template decode<peggy::schema::outgoing_tx_batch_t>(value));
    }
    return out;
  }

  /// Up to `count` most recent batches, nonce descending.
  std::vector<peggy::schema::outgoing_tx_batch_t> last(
      std::size_t count) const {
    return last_records<peggy::schema::outgoing_tx_batch_t>(encoder_, store_,
                                                            prefix(), count);
  }

  /// Most recent batch accepted by `match`.
  template <typename Predicate>
  std::optional<peggy::schema::outgoing_tx_batch_t> find_last(
      Predicate&& match) const {
    return find_last_record<peggy::schema::outgoing_tx_batch_t>(
        encoder_, store_, prefix(), std::forward<Predicate>(match));
  }

 private:
  static peggy::schema::bytes_t prefix() {
    return peggy::schema::key::make_prefix_key(
        peggy::schema::key::kBatchKeyPrefix);
  }

  Encoder& encoder_;
  Store& store_;
};

/// Turns the head of the outgoing pool for one contract into a batch.
template <typename Encoder, typename Store>
class batch_builder final {
 public:
  batch_builder(Encoder& encoder, Store& store)
      : encoder_{encoder}, store_{store} {}

  /// Take up to `max_size` transfers for `token_contract` in pool order and
  /// stamp them with the next batch nonce and `height`.
  ///
  /// Returns std::nullopt, with no state change, when nothing is queued for
  /// the contract.
  std::optional<peggy::schema::outgoing_tx_batch_t> build_batch(
      const peggy::schema::eth_address_t& token_contract,
      const std::size_t max_size,
      const uint64_t height) {
    auto pool = outgoing_pool<Encoder, Store>{encoder_, store_};
    auto selected = pool.by_fee(token_contract, max_size);
    if (selected.empty()) {
      spdlog::debug("Nothing to batch for {}",
                    peggy::schema::to_string(token_contract));
      return std::nullopt;
    }

    auto ids = std::vector<uint64_t>{};
    ids.reserve(selected.size());
    for (const auto& tx : selected) {
      ids.push_back(tx.id);
    }
    pool.dequeue(ids);

    auto batch = peggy::schema::outgoing_tx_batch_t{
        .batch_nonce = next_sequence(encoder_, store_,
                                     peggy::schema::key::kBatchSequence),
        .block = height,
        .token_contract = token_contract,
        .transactions = std::move(selected)};
    batch_store<Encoder, Store>{encoder_, store_}.put(batch);
    spdlog::info("Created batch {} for {} with {} transfer(s)",
                 batch.batch_nonce, peggy::schema::to_string(token_contract),
                 batch.transactions.size());
    return batch;
  }

 private:
  Encoder& encoder_;
  Store& store_;
};

}  // namespace peggy::bridge
