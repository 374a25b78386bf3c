#include <peggy/common/critical.hpp>
#include <peggy/storage/rocksdb/storage.hpp>

namespace peggy::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    peggy::common::critical("Failed to open RocksDB", "RocksDB open {}: {}", path,
                            status.ToString());
  }
  spdlog::info("Opened RocksDB bridge store at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace peggy::storage
