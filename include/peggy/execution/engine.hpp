#pragma once

#include <peggy/bridge/collaborators.hpp>
#include <peggy/execution/engine_options.hpp>
#include <peggy/schema/app_info.hpp>
#include <peggy/schema/block_result.hpp>
#include <peggy/schema/commit_result.hpp>
#include <peggy/schema/encoding/scale/encoder.hpp>
#include <peggy/schema/primitives.hpp>
#include <peggy/schema/query_result.hpp>
#include <peggy/schema/transaction.hpp>
#include <peggy/schema/transaction_error_code.hpp>
#include <peggy/schema/transaction_result.hpp>
#include <peggy/storage/cache/storage.hpp>
#include <peggy/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

namespace peggy::execution {

/// Deterministic bridge state machine driven by the hosting consensus engine.
///
/// Transactions of a block are executed one at a time against a per block
/// write buffer. Each transaction gets its own buffer on top of that and is
/// merged only when it succeeds. commit() writes the block buffer together
/// with the new height and state root as one RocksDB write batch.
class engine final {
 public:
  /// Construct the engine over an opened store. Every collaborator must be
  /// set; a missing one is fatal.
  engine(peggy::schema::encoding::scale_encoder_t& encoder,
         peggy::storage::rocksdb_storage_t& storage,
         peggy::bridge::collaborators collaborators,
         engine_options options = {});

  /// Mempool admission. Decodes and runs the stateless checks (version,
  /// addresses, signer authorization); never touches state.
  peggy::schema::transaction_result_t check_transaction(
      const peggy::schema::bytes_view_t& raw_tx);

  /// Execute a block in order and return per transaction results plus the
  /// candidate state root. Writes stay buffered until commit().
  peggy::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<peggy::schema::bytes_t>& txs);

  /// Persist the last finalized block.
  peggy::schema::commit_result_t commit();

  peggy::schema::app_info_t info() const;

  /// Read-only lookup over committed state. See query.cpp for the routes.
  peggy::schema::query_result_t query(std::string_view path,
                                      const peggy::schema::bytes_view_t& data);

 private:
  using block_store_t =
      peggy::storage::cache_storage_t<peggy::storage::rocksdb_storage_t>;
  using transaction_store_t = peggy::storage::cache_storage_t<block_store_t>;

  /// Envelope version, address syntax and signer authorization.
  peggy::schema::transaction_result_t validate_transaction(
      const peggy::schema::transaction_t& tx,
      std::string_view codespace) const;

  /// Apply a validated payload to `store`.
  peggy::schema::transaction_result_t execute_operation(
      const peggy::schema::transaction_t& tx,
      transaction_store_t& store);

  void load_persisted_state();

  mutable std::mutex mutex_;
  peggy::schema::encoding::scale_encoder_t& encoder_;
  peggy::storage::rocksdb_storage_t& storage_;
  peggy::bridge::collaborators collaborators_;
  engine_options options_;
  block_store_t block_store_;
  int64_t last_committed_height_{};
  peggy::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  peggy::schema::hash32_t pending_state_root_{};
  uint64_t current_block_height_{};
};

}  // namespace peggy::execution
