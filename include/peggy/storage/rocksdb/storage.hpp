#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <peggy/common/critical.hpp>
#include <peggy/schema/encoding/scale/encoder.hpp>
#include <peggy/storage/storage.hpp>
#include <memory>
#include <string_view>
#include <tuple>

namespace peggy::storage {

namespace detail {

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline peggy::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const peggy::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const peggy::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const peggy::schema::bytes_view_t& key,
           const T& value);

  std::optional<peggy::schema::bytes_t> get_raw(
      const peggy::schema::bytes_view_t& key) const;
  void put_raw(const peggy::schema::bytes_view_t& key,
               const peggy::schema::bytes_view_t& value);
  void erase(const peggy::schema::bytes_view_t& key);
  std::vector<key_value_entry_t> list_by_prefix(
      const peggy::schema::bytes_view_t& prefix) const;

  template <typename Visitor>
  void scan_prefix_reverse(const peggy::schema::bytes_view_t& prefix,
                           Visitor&& visit) const;

  /// Apply writes in a single RocksDB write batch. When `state` is provided
  /// the committed checkpoint is written in the same batch.
  void apply_writes(const std::vector<pending_write_t>& writes,
                    const std::optional<committed_state>& state = std::nullopt);

  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state);

 private:
  void ensure_open() const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const peggy::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      peggy::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const peggy::schema::bytes_view_t& key,
                                       const T& value) {
  auto encoded_value = encoder.encode(value);
  put_raw(key, peggy::schema::bytes_view_t{encoded_value.data(),
                                           encoded_value.size()});
}

template <typename Visitor>
void storage<rocksdb_storage_tag>::scan_prefix_reverse(
    const peggy::schema::bytes_view_t& prefix,
    Visitor&& visit) const {
  ensure_open();

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  auto prefix_slice = detail::to_slice(prefix);
  if (auto upper = detail::prefix_upper_bound(prefix)) {
    iterator->SeekForPrev(detail::to_slice(*upper));
    if (iterator->Valid() && iterator->key() == detail::to_slice(*upper)) {
      iterator->Prev();
    }
  } else {
    iterator->SeekToLast();
  }
  for (; iterator->Valid(); iterator->Prev()) {
    if (!iterator->key().starts_with(prefix_slice) ||
        !visit(detail::to_bytes(iterator->key()),
               detail::to_bytes(iterator->value()))) {
      break;
    }
  }
  if (!iterator->status().ok()) {
    peggy::common::critical("RocksDB iteration failed",
                            "RocksDB reverse iterator: {}",
                            iterator->status().ToString());
  }
}

inline void storage<rocksdb_storage_tag>::ensure_open() const {
  if (!database) {
    peggy::common::critical("RocksDB database is not initialized");
  }
}

inline std::optional<peggy::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const peggy::schema::bytes_view_t& key) const {
  ensure_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    peggy::common::critical("Failed to get value from RocksDB", "RocksDB get: {}",
                            status.ToString());
  }
  return peggy::schema::make_bytes(value);
}

inline void storage<rocksdb_storage_tag>::put_raw(
    const peggy::schema::bytes_view_t& key,
    const peggy::schema::bytes_view_t& value) {
  ensure_open();
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key), detail::to_slice(value));
  if (!status.ok()) {
    peggy::common::critical("Failed to put value into RocksDB", "RocksDB put: {}",
                            status.ToString());
  }
}

inline void storage<rocksdb_storage_tag>::erase(
    const peggy::schema::bytes_view_t& key) {
  ensure_open();
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    peggy::common::critical("Failed to delete key from RocksDB",
                            "RocksDB delete: {}", status.ToString());
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const peggy::schema::bytes_view_t& prefix) const {
  ensure_open();

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = peggy::schema::make_string_view(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(detail::to_slice(prefix)); iterator->Valid();
       iterator->Next()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    peggy::common::critical("RocksDB iteration failed", "RocksDB iterator: {}",
                            iterator->status().ToString());
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::apply_writes(
    const std::vector<pending_write_t>& writes,
    const std::optional<committed_state>& state) {
  ensure_open();

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice = detail::to_slice(key);
    auto status = value ? batch.Put(key_slice, detail::to_slice(*value))
                        : batch.Delete(key_slice);
    if (!status.ok()) {
      peggy::common::critical("failed staging write batch entry");
    }
  }

  if (state) {
    auto encoder = peggy::schema::encoding::scale_encoder_t{};
    auto encoded = encoder.encode(std::tuple{state->height, state->state_root});
    auto status = batch.Put(
        ROCKSDB_NAMESPACE::Slice{detail::kCommittedHeightKey.data(),
                                 detail::kCommittedHeightKey.size()},
        detail::to_slice(encoded));
    if (!status.ok()) {
      peggy::common::critical("failed staging committed state");
    }
  }

  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    peggy::common::critical("failed to commit write batch",
                            "RocksDB write batch: {}", status.ToString());
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_raw(peggy::schema::make_bytes_view(detail::kCommittedHeightKey));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = peggy::schema::encoding::scale_encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, peggy::schema::hash32_t>>(
          peggy::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    peggy::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) {
  apply_writes({}, state);
}

}  // namespace peggy::storage
